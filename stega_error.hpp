#ifndef STEGA_ERROR_HPP
#define STEGA_ERROR_HPP

#include <string>

namespace stega {

    enum class Error {
        Ok = 0,

        // validation
        InvalidArgument,
        InvalidLsbBits,
        InvalidBitOrder,
        InvalidKey,
        InvalidNonce,
        OutOfCapacity,
        CapacityExceeded,
        NotUtf8,
        Validation,

        // header format
        HeaderTooShort,
        BadMagic,
        UnsupportedVersion,
        InvalidNonceLength,
        InvalidFilenameLength,
        HeaderSizeChanged,

        // primitives
        RandomFailure,
        DigestFailure,

        // honey
        UnknownUniverse,
        MessageNotInUniverse,
        ResolutionMismatch,
        HoneyTooShort,
        HoneyBadMagic,
        HoneyTruncated,
        HoneyBadUniverseName,
        HoneyTrailingBytes,
        HoneySeedOutOfRange,

        // strict decode
        LsbMismatch,
        StartOffsetOverlap,
        PayloadClamped,
        IntegrityCheckFailed,

        // media adapters
        UnsupportedImage,
        UnsupportedAudio,
    };

    const char* errorString(Error err);

    enum class WarningKind {
        HeaderUnreadable,
        LsbMismatch,
        StartOffsetOverlap,
        PayloadClamped,
        DecryptFailed,
        HoneyDecodeFailed,
        IntegrityCheckFailed,
    };

    // Non-fatal decode finding, returned to the caller instead of logged
    struct Warning {
        WarningKind kind;
        std::string message;
    };

} // namespace stega

#endif // STEGA_ERROR_HPP
