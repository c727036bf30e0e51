#include <cstdio>
#include <cstdlib>
#include <set>
#include <string>
#include <vector>

#include "bit_stream.hpp"
#include "stega_codec.hpp"

#define ASSERT(cond, text) if (!(cond)) { printf(text); abort(); }

using namespace stega;

class CodecTests {
  public:
    void runTests() {
      printf("Running tests for stego codec...\n");

      this->CapacityHelpersShouldCountLsbBits();
      this->NumericKeyShouldAcceptDigitsOnly();
      this->KeyedBitOrderShouldFollowKey();
      this->HelloWorldShouldRoundTrip();
      this->EncodeShouldOnlyTouchLsbWindow();
      this->WrongKeyShouldGiveIntegrityWarning();
      this->XorModeShouldRoundTrip();
      this->CapacityBoundaryShouldBeExact();
      this->PayloadShouldNeverShareHeaderByte();
      this->ExplicitStartShouldBeValidated();
      this->DrawnStartShouldLeaveRoomForPayload();
      this->InvalidArgumentsShouldLeaveCoverUntouched();
      this->HoneyModeShouldRoundTrip();
      this->HoneyModeShouldRejectBadInputs();
      this->CorruptPayloadShouldFailOnlyInStrictMode();
      this->LsbMismatchShouldFollowDeclaredValue();
      this->StartOverlapShouldBeReported();
      this->OversizedLengthShouldBeClamped();
      this->UnreadableHeaderShouldFallBackToDegradedRead();
      this->BufferShorterThanHeaderShouldFail();

      printf("All tests complete for stego codec!\n");
      printf("---------------------------------\n\n");
    };

  private:
    std::vector<uint8_t> bytes(const std::string& s) {
      return std::vector<uint8_t>(s.begin(), s.end());
    };

    // 100x100 RGB, all zero
    std::vector<uint8_t> blankCover() {
      return std::vector<uint8_t>(100 * 100 * 3, 0);
    };

    std::vector<uint8_t> helloCover(int lsbBits, const std::string& key) {
      std::vector<uint8_t> cover = blankCover();
      HeaderMeta header;
      ASSERT(encode(cover, bytes("hello world"), "", lsbBits, key, EncodeOptions(), header) == Error::Ok,
             "encode failed\n")
      return cover;
    };

    // overwrite a header field in place (identity order at 1 LSB)
    void patchHeader(std::vector<uint8_t>& cover, size_t byteOffset, int nbits, uint64_t value) {
      BitStream bs(cover.data(), cover.size(), 1, identityBitOrder(1));
      uint64_t next = 0;
      ASSERT(bs.writeBits(byteOffset * 8, nbits, value, next) == Error::Ok, "header patch failed\n")
    };

    DecodeOptions strict() {
      DecodeOptions o;
      o.mode = DecodeMode::Strict;
      return o;
    };

    void CapacityHelpersShouldCountLsbBits() {
      ASSERT(capacityBits(100, 3) == 300, "capacityBits wrong\n")
      ASSERT(capacityBits(100, 0) == 0 && capacityBits(100, 9) == 0, "invalid LSB count has capacity\n")
      ASSERT(availablePayloadBytes(296, 1, 200) == 12, "availablePayloadBytes wrong\n")
      ASSERT(availablePayloadBytes(296, 1, 296) == 0, "no room past the end\n")
      ASSERT(availablePayloadBytes(296, 1, 1000) == 0, "start past the end has room\n")
    };

    void NumericKeyShouldAcceptDigitsOnly() {
      NumericKey k;
      ASSERT(NumericKey::parse("12345", k) && k.value() == 12345, "12345 not parsed\n")
      ASSERT(NumericKey::parse("007", k) && k.value() == 7 && k.toString() == "7", "leading zeros wrong\n")
      ASSERT(NumericKey::parse("9223372036854775807", k), "INT64_MAX rejected\n")
      ASSERT(!NumericKey::parse("9223372036854775808", k), "INT64_MAX + 1 accepted\n")
      ASSERT(!NumericKey::parse("", k), "empty key accepted\n")
      ASSERT(!NumericKey::parse("-5", k), "negative key accepted\n")
      ASSERT(!NumericKey::parse("12a", k), "non-digit accepted\n")
    };

    void KeyedBitOrderShouldFollowKey() {
      ASSERT(keyedBitOrder("12345", 8) == std::vector<int>({4, 2, 5, 1, 0, 7, 3, 6}), "order for 12345 wrong\n")
      ASSERT(keyedBitOrder("99999", 2) == std::vector<int>({1, 0}), "order for 99999 wrong\n")
      ASSERT(keyedBitOrder("anything", 1) == std::vector<int>({0}), "single LSB order must be [0]\n")
    };

    void HelloWorldShouldRoundTrip() {
      std::vector<uint8_t> cover = helloCover(1, "12345");

      HeaderMeta meta;
      size_t headerSize = 0;
      ASSERT(readHeader(cover, 1, meta, headerSize) == Error::Ok, "header not readable without key\n")
      ASSERT(headerSize == HEADER_MIN_SIZE && meta.payloadLen == 11, "header fields wrong\n")

      DecodeResult out;
      ASSERT(decode(cover, 1, "12345", DecodeOptions(), out) == Error::Ok, "decode failed\n")
      ASSERT(out.headerValid, "header not valid\n")
      ASSERT(out.payload == bytes("hello world"), "payload not recovered\n")
      ASSERT(!out.hasWarning(WarningKind::IntegrityCheckFailed), "CRC check failed on right key\n")
      ASSERT(out.warnings.empty(), "clean decode produced warnings\n")
      ASSERT(out.headerError == Error::Ok, "valid header reported an error\n")

      ASSERT(decode(cover, 1, "12345", strict(), out) == Error::Ok, "strict decode failed\n")
      ASSERT(out.payload == bytes("hello world"), "strict payload not recovered\n")
    };

    void EncodeShouldOnlyTouchLsbWindow() {
      std::vector<uint8_t> cover(5000);
      for (size_t i = 0; i < cover.size(); i++) cover[i] = static_cast<uint8_t>(i * 37 + 11);
      std::vector<uint8_t> before = cover;

      HeaderMeta header;
      ASSERT(encode(cover, bytes("some secret payload"), "a.txt", 3, "k", EncodeOptions(), header) == Error::Ok,
             "encode failed\n")
      for (size_t i = 0; i < cover.size(); i++) {
        ASSERT(((cover[i] ^ before[i]) & 0xF8) == 0, "encode changed bits above the LSB window\n")
      }

      DecodeResult out;
      ASSERT(decode(cover, 3, "k", DecodeOptions(), out) == Error::Ok, "decode failed\n")
      ASSERT(out.payload == bytes("some secret payload") && out.warnings.empty(), "noisy cover round trip failed\n")
      ASSERT(out.header.filename == "a.txt", "filename lost\n")
    };

    void WrongKeyShouldGiveIntegrityWarning() {
      // with a single LSB the bit order is always [0], so a wrong key only
      // shows up once the order or the keystream depends on it
      std::vector<uint8_t> cover = helloCover(2, "12345");
      DecodeResult out;
      ASSERT(decode(cover, 2, "99999", DecodeOptions(), out) == Error::Ok, "wrong key decode should not fail\n")
      ASSERT(out.hasWarning(WarningKind::IntegrityCheckFailed), "no CRC warning for wrong key\n")
      ASSERT(out.payload != bytes("hello world"), "wrong key recovered the payload\n")

      cover = blankCover();
      EncodeOptions xor_;
      xor_.mode = TransformMode::Xor;
      HeaderMeta header;
      ASSERT(encode(cover, bytes("hello world"), "", 1, "12345", xor_, header) == Error::Ok, "encode failed\n")
      ASSERT(decode(cover, 1, "99999", DecodeOptions(), out) == Error::Ok, "wrong key decode should not fail\n")
      ASSERT(out.hasWarning(WarningKind::IntegrityCheckFailed), "no CRC warning for wrong XOR key\n")
      ASSERT(out.payload != bytes("hello world"), "wrong XOR key recovered the payload\n")

      ASSERT(decode(cover, 1, "99999", strict(), out) == Error::IntegrityCheckFailed, "strict mode accepted wrong key\n")
    };

    void XorModeShouldRoundTrip() {
      std::vector<uint8_t> cover = blankCover();
      EncodeOptions opts;
      opts.mode = TransformMode::Xor;
      HeaderMeta header;
      ASSERT(encode(cover, bytes("attack at dawn"), "orders.txt", 3, "pass phrase", opts, header) == Error::Ok,
             "encode failed\n")
      ASSERT(header.encrypted() && header.nonce.size() == DEFAULT_NONCE_LEN, "encrypted header fields wrong\n")

      DecodeResult out;
      ASSERT(decode(cover, 3, "pass phrase", DecodeOptions(), out) == Error::Ok, "decode failed\n")
      ASSERT(out.payload == bytes("attack at dawn") && out.warnings.empty(), "XOR payload not recovered\n")
      ASSERT(out.header.filename == "orders.txt", "filename lost\n")

      opts.nonceLength = 0;
      std::vector<uint8_t> fresh = blankCover();
      ASSERT(encode(fresh, bytes("x"), "", 1, "k", opts, header) == Error::InvalidNonce, "zero nonce accepted\n")
    };

    void CapacityBoundaryShouldBeExact() {
      // 25-byte header = 200 bits, 296 cover bytes at 1 LSB leaves exactly 96 bits
      EncodeOptions opts;
      opts.hasStartBit = true;
      opts.startBit = 200;
      HeaderMeta header;

      std::vector<uint8_t> cover(296, 0);
      std::vector<uint8_t> fits(12, 0xA5);
      ASSERT(encode(cover, fits, "", 1, "12345", opts, header) == Error::Ok, "exact fit rejected\n")
      ASSERT(header.startBitOffset == 200, "explicit start not stored\n")

      DecodeResult out;
      ASSERT(decode(cover, 1, "12345", DecodeOptions(), out) == Error::Ok, "decode failed\n")
      ASSERT(out.payload == fits && out.warnings.empty(), "exact fit not recovered\n")

      std::vector<uint8_t> tooBig(13, 0xA5);
      std::vector<uint8_t> clean(296, 0);
      ASSERT(encode(clean, tooBig, "", 1, "12345", opts, header) == Error::CapacityExceeded,
             "one byte over capacity accepted\n")
      ASSERT(clean == std::vector<uint8_t>(296, 0), "failed encode modified the cover\n")
    };

    void PayloadShouldNeverShareHeaderByte() {
      // 200 header bits end mid-byte when the LSB count does not divide 8
      ASSERT(firstPayloadBit(200, 1) == 200 && firstPayloadBit(200, 4) == 200, "aligned floor moved\n")
      ASSERT(firstPayloadBit(200, 3) == 201 && firstPayloadBit(200, 6) == 204, "floor not rounded up\n")

      const int lsbs[] = {3, 5, 6, 7};
      for (int lsb : lsbs) {
        const uint64_t floorBit = firstPayloadBit(200, lsb);
        for (int k = 1000; k < 1020; k++) {
          std::string key = std::to_string(k);
          HeaderMeta header;
          DecodeResult out;

          EncodeOptions opts;
          opts.hasStartBit = true;
          opts.startBit = 200;
          std::vector<uint8_t> cover(3000, 0);
          if (floorBit > 200) {
            ASSERT(encode(cover, bytes("hello world"), "", lsb, key, opts, header) == Error::CapacityExceeded,
                   "start inside the header's last byte accepted\n")
            ASSERT(cover == std::vector<uint8_t>(3000, 0), "rejected encode modified the cover\n")
          }

          opts.startBit = floorBit;
          ASSERT(encode(cover, bytes("hello world"), "", lsb, key, opts, header) == Error::Ok,
                 "start at the first free bit rejected\n")
          ASSERT(decode(cover, lsb, key, strict(), out) == Error::Ok, "boundary start round trip failed\n")
          ASSERT(out.payload == bytes("hello world") && out.warnings.empty(), "boundary payload damaged\n")

          cover.assign(3000, 0);
          ASSERT(encode(cover, bytes("hello world"), "", lsb, key, EncodeOptions(), header) == Error::Ok,
                 "encode failed\n")
          ASSERT(header.startBitOffset >= floorBit, "drawn start inside the header's last byte\n")
          ASSERT(decode(cover, lsb, key, strict(), out) == Error::Ok && out.payload == bytes("hello world"),
                 "drawn start round trip failed\n")
        }
      }

      // at 6 LSBs the payload may start at bit 204 at the earliest: 39 cover
      // bytes hold 234 bits, enough for 200 + 32 but not for 204 + 32
      std::vector<uint8_t> fits(40, 0);
      HeaderMeta header;
      DecodeResult out;
      ASSERT(encode(fits, bytes("abcd"), "", 6, "k", EncodeOptions(), header) == Error::Ok, "tight fit at 6 LSBs rejected\n")
      ASSERT(header.startBitOffset >= 204 && header.startBitOffset + 32 <= 240, "tight fit start out of range\n")
      ASSERT(decode(fits, 6, "k", strict(), out) == Error::Ok && out.payload == bytes("abcd"), "tight fit damaged\n")

      std::vector<uint8_t> small(39, 0);
      ASSERT(encode(small, bytes("abcd"), "", 6, "k", EncodeOptions(), header) == Error::CapacityExceeded,
             "fit that needs the header's last byte accepted\n")
    };

    void ExplicitStartShouldBeValidated() {
      EncodeOptions opts;
      opts.hasStartBit = true;
      HeaderMeta header;
      std::vector<uint8_t> cover = blankCover();

      opts.startBit = 199;
      ASSERT(encode(cover, bytes("x"), "", 1, "k", opts, header) == Error::CapacityExceeded, "start inside header accepted\n")

      opts.startBit = cover.size() - 7;
      ASSERT(encode(cover, bytes("x"), "", 1, "k", opts, header) == Error::CapacityExceeded, "start too late accepted\n")

      opts.startBit = cover.size() - 8;
      ASSERT(encode(cover, bytes("x"), "", 1, "k", opts, header) == Error::Ok, "last possible start rejected\n")
    };

    void DrawnStartShouldLeaveRoomForPayload() {
      std::set<uint64_t> starts;
      for (int k = 0; k < 20; k++) {
        std::vector<uint8_t> cover(400, 0);
        HeaderMeta header;
        std::string key = "key" + std::to_string(k);
        ASSERT(encode(cover, bytes("abcd"), "", 1, key, EncodeOptions(), header) == Error::Ok, "encode failed\n")
        ASSERT(header.startBitOffset >= 200, "drawn start overlaps header\n")
        ASSERT(header.startBitOffset + 32 <= 400, "drawn start leaves no room\n")
        starts.insert(header.startBitOffset);

        DecodeResult out;
        ASSERT(decode(cover, 1, key, DecodeOptions(), out) == Error::Ok && out.payload == bytes("abcd"),
               "drawn start round trip failed\n")
      }
      ASSERT(starts.size() > 1, "start position does not depend on key\n")
    };

    void InvalidArgumentsShouldLeaveCoverUntouched() {
      std::vector<uint8_t> cover = blankCover();
      HeaderMeta header;
      ASSERT(encode(cover, bytes("x"), "", 0, "k", EncodeOptions(), header) == Error::InvalidLsbBits, "lsb 0 accepted\n")
      ASSERT(encode(cover, bytes("x"), "", 9, "k", EncodeOptions(), header) == Error::InvalidLsbBits, "lsb 9 accepted\n")
      ASSERT(encode(cover, bytes("x"), "", 1, "", EncodeOptions(), header) == Error::InvalidKey, "empty key accepted\n")
      ASSERT(cover == blankCover(), "rejected encode modified the cover\n")

      DecodeResult out;
      ASSERT(decode(cover, 0, "k", DecodeOptions(), out) == Error::InvalidLsbBits, "decode lsb 0 accepted\n")
      ASSERT(decode(cover, 1, "", DecodeOptions(), out) == Error::InvalidKey, "decode empty key accepted\n")
    };

    void HoneyModeShouldRoundTrip() {
      honey::UniverseRegistry registry;
      ASSERT(honey::registerBuiltinUniverses(registry) == Error::Ok, "builtin registration failed\n")

      EncodeOptions opts;
      opts.mode = TransformMode::Honey;
      opts.universe = "short_notes";
      opts.registry = &registry;

      std::vector<uint8_t> cover = blankCover();
      HeaderMeta header;
      ASSERT(encode(cover, bytes("Check server status"), "note", 1, "4242", opts, header) == Error::Ok,
             "Honey encode failed\n")
      ASSERT(!header.encrypted(), "Honey payload should not set the encrypted flag\n")

      DecodeOptions dopts;
      dopts.registry = &registry;
      DecodeResult out;
      ASSERT(decode(cover, 1, "4242", dopts, out) == Error::Ok, "Honey decode failed\n")
      ASSERT(out.honeyDecoded && out.payload == bytes("Check server status"), "Honey message not recovered\n")
      ASSERT(out.warnings.empty(), "right key produced warnings\n")

      std::set<std::string> notes(registry.get("short_notes")->messages.begin(),
                                  registry.get("short_notes")->messages.end());
      for (int k = 0; k < 20; k++) {
        ASSERT(decode(cover, 1, std::to_string(5000 + k), dopts, out) == Error::Ok, "decoy decode failed\n")
        ASSERT(out.honeyDecoded, "decoy not Honey-decoded\n")
        ASSERT(notes.count(std::string(out.payload.begin(), out.payload.end())) == 1, "decoy outside universe\n")
      }

      // without a registry the blob comes back raw
      ASSERT(decode(cover, 1, "4242", DecodeOptions(), out) == Error::Ok, "decode failed\n")
      ASSERT(out.hasWarning(WarningKind::HoneyDecodeFailed) && honey::isHoneyBlob(out.payload),
             "raw blob not returned\n")
      ASSERT(decode(cover, 1, "4242", strict(), out) == Error::UnknownUniverse, "strict mode accepted missing registry\n")
    };

    void HoneyModeShouldRejectBadInputs() {
      honey::UniverseRegistry registry;
      ASSERT(honey::registerBuiltinUniverses(registry) == Error::Ok, "builtin registration failed\n")
      EncodeOptions opts;
      opts.mode = TransformMode::Honey;
      opts.registry = &registry;

      std::vector<uint8_t> cover = blankCover();
      HeaderMeta header;
      ASSERT(encode(cover, bytes("Call the client"), "", 1, "12ab", opts, header) == Error::InvalidKey,
             "non-numeric Honey key accepted\n")
      ASSERT(encode(cover, bytes("not a note"), "", 1, "12", opts, header) == Error::MessageNotInUniverse,
             "foreign message accepted\n")
      ASSERT(encode(cover, std::vector<uint8_t>({0xC3, 0x28}), "", 1, "12", opts, header) == Error::NotUtf8,
             "invalid UTF-8 accepted\n")
      opts.universe = "missing";
      ASSERT(encode(cover, bytes("Call the client"), "", 1, "12", opts, header) == Error::UnknownUniverse,
             "unknown universe accepted\n")
      opts.registry = nullptr;
      ASSERT(encode(cover, bytes("Call the client"), "", 1, "12", opts, header) == Error::UnknownUniverse,
             "missing registry accepted\n")
      ASSERT(cover == blankCover(), "rejected encode modified the cover\n")
    };

    void CorruptPayloadShouldFailOnlyInStrictMode() {
      std::vector<uint8_t> cover = helloCover(1, "12345");
      HeaderMeta meta;
      size_t headerSize = 0;
      ASSERT(readHeader(cover, 1, meta, headerSize) == Error::Ok, "readHeader failed\n")
      cover[meta.startBitOffset] ^= 1;

      DecodeResult out;
      ASSERT(decode(cover, 1, "12345", DecodeOptions(), out) == Error::Ok, "permissive decode failed\n")
      ASSERT(out.hasWarning(WarningKind::IntegrityCheckFailed), "corruption not reported\n")
      ASSERT(decode(cover, 1, "12345", strict(), out) == Error::IntegrityCheckFailed, "strict decode accepted corruption\n")
    };

    void LsbMismatchShouldFollowDeclaredValue() {
      // unusable declared value: payload still read with the caller's count
      std::vector<uint8_t> cover = helloCover(1, "12345");
      patchHeader(cover, 6, 8, 9);

      DecodeResult out;
      ASSERT(decode(cover, 1, "12345", DecodeOptions(), out) == Error::Ok, "decode failed\n")
      ASSERT(out.hasWarning(WarningKind::LsbMismatch), "mismatch not reported\n")
      ASSERT(out.payload == bytes("hello world") && !out.hasWarning(WarningKind::IntegrityCheckFailed),
             "payload not read with caller's LSB count\n")
      ASSERT(decode(cover, 1, "12345", strict(), out) == Error::LsbMismatch, "strict mode accepted mismatch\n")

      // usable declared value wins, so this payload is misaddressed
      cover = helloCover(1, "12345");
      patchHeader(cover, 6, 8, 2);
      ASSERT(decode(cover, 1, "12345", DecodeOptions(), out) == Error::Ok, "decode failed\n")
      ASSERT(out.hasWarning(WarningKind::LsbMismatch), "mismatch not reported\n")
      ASSERT(out.header.lsbBits == 2, "declared LSB count not kept in the header\n")
      ASSERT(out.hasWarning(WarningKind::IntegrityCheckFailed), "misaddressed payload passed the CRC\n")
    };

    void StartOverlapShouldBeReported() {
      std::vector<uint8_t> cover = helloCover(1, "12345");
      patchHeader(cover, 7, 64, 16);

      DecodeResult out;
      ASSERT(decode(cover, 1, "12345", DecodeOptions(), out) == Error::Ok, "decode failed\n")
      ASSERT(out.hasWarning(WarningKind::StartOffsetOverlap), "overlap not reported\n")
      ASSERT(out.payload.size() == 11, "overlapping payload not read\n")
      ASSERT(decode(cover, 1, "12345", strict(), out) == Error::StartOffsetOverlap, "strict mode accepted overlap\n")
    };

    void OversizedLengthShouldBeClamped() {
      std::vector<uint8_t> cover = helloCover(1, "12345");
      HeaderMeta meta;
      size_t headerSize = 0;
      ASSERT(readHeader(cover, 1, meta, headerSize) == Error::Ok, "readHeader failed\n")
      patchHeader(cover, 15, 32, 0xFFFFFFFFu);

      DecodeResult out;
      ASSERT(decode(cover, 1, "12345", DecodeOptions(), out) == Error::Ok, "decode failed\n")
      ASSERT(out.hasWarning(WarningKind::PayloadClamped), "clamp not reported\n")
      ASSERT(out.payload.size() == (cover.size() - meta.startBitOffset) / 8, "payload not clamped to capacity\n")
      ASSERT(std::vector<uint8_t>(out.payload.begin(), out.payload.begin() + 11) == bytes("hello world"),
             "clamped read lost the payload\n")
      ASSERT(decode(cover, 1, "12345", strict(), out) == Error::PayloadClamped, "strict mode accepted clamp\n")
    };

    void UnreadableHeaderShouldFallBackToDegradedRead() {
      std::vector<uint8_t> cover(1000, 0);
      DecodeResult out;
      ASSERT(decode(cover, 1, "12345", DecodeOptions(), out) == Error::Ok, "permissive decode failed\n")
      ASSERT(!out.headerValid && out.hasWarning(WarningKind::HeaderUnreadable), "unreadable header not reported\n")
      ASSERT(out.headerError == Error::BadMagic, "header error not kept on the result\n")
      ASSERT(out.payload.size() == DEGRADED_READ_BYTES, "degraded read has wrong size\n")
      ASSERT(out.header.startBitOffset == HEADER_MIN_SIZE * 8, "degraded read starts at the wrong bit\n")
      ASSERT(decode(cover, 1, "12345", strict(), out) == Error::BadMagic, "strict mode accepted bad magic\n")
    };

    void BufferShorterThanHeaderShouldFail() {
      std::vector<uint8_t> tiny(19, 0xFF);
      HeaderMeta meta;
      size_t headerSize = 0;
      ASSERT(readHeader(tiny, 8, meta, headerSize) == Error::HeaderTooShort, "short buffer header accepted\n")

      DecodeResult out;
      ASSERT(decode(tiny, 8, "12345", strict(), out) == Error::HeaderTooShort, "short buffer not rejected\n")
      ASSERT(decode(tiny, 8, "12345", DecodeOptions(), out) == Error::Ok, "permissive decode failed\n")
      ASSERT(out.hasWarning(WarningKind::HeaderUnreadable) && out.payload.empty(), "short buffer produced payload\n")
      ASSERT(out.headerError == Error::HeaderTooShort, "header error not kept on the result\n")
    };
};

int main(int argc, char **argv) {
  CodecTests tests;
  tests.runTests();

  printf("All tests passed :)\n");
  return 0;
}
