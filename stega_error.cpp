#include "stega_error.hpp"

namespace stega {

    const char* errorString(Error err)
    {
        switch (err) {
        case Error::Ok:                    return "ok";
        case Error::InvalidArgument:       return "invalid argument";
        case Error::InvalidLsbBits:        return "LSB bits must be 1..8";
        case Error::InvalidBitOrder:       return "bit order is not a permutation of the LSB slots";
        case Error::InvalidKey:            return "key is empty or not numeric";
        case Error::InvalidNonce:          return "nonce required for keystream derivation";
        case Error::OutOfCapacity:         return "bit access beyond buffer capacity";
        case Error::CapacityExceeded:      return "not enough capacity for header and payload";
        case Error::NotUtf8:               return "payload is not valid UTF-8 text";
        case Error::Validation:            return "validation failed";
        case Error::HeaderTooShort:        return "header too short";
        case Error::BadMagic:              return "invalid header magic";
        case Error::UnsupportedVersion:    return "unsupported header version";
        case Error::InvalidNonceLength:    return "nonce length invalid";
        case Error::InvalidFilenameLength: return "filename length invalid";
        case Error::HeaderSizeChanged:     return "header size changed unexpectedly";
        case Error::RandomFailure:         return "secure random source failed";
        case Error::DigestFailure:         return "digest computation failed";
        case Error::UnknownUniverse:       return "unknown universe";
        case Error::MessageNotInUniverse:  return "message is not part of universe";
        case Error::ResolutionMismatch:    return "resolution mismatch between blob and universe";
        case Error::HoneyTooShort:         return "Honey payload is too short";
        case Error::HoneyBadMagic:         return "missing HONEY1 magic header";
        case Error::HoneyTruncated:        return "Honey payload truncated while reading universe";
        case Error::HoneyBadUniverseName:  return "Honey universe name is not ASCII";
        case Error::HoneyTrailingBytes:    return "unexpected trailing bytes in Honey payload";
        case Error::HoneySeedOutOfRange:   return "seed does not map to any message interval";
        case Error::LsbMismatch:           return "header LSB bits differ from configured value";
        case Error::StartOffsetOverlap:    return "payload start overlaps header";
        case Error::PayloadClamped:        return "payload length exceeds remaining capacity";
        case Error::IntegrityCheckFailed:  return "integrity check failed";
        case Error::UnsupportedImage:      return "unsupported image layout";
        case Error::UnsupportedAudio:      return "unsupported PCM layout";
        }
        return "unknown error";
    }

}
