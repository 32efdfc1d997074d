#ifndef CONTENT_DECODER_HPP
#define CONTENT_DECODER_HPP

#include <optional>
#include <string>

#include "http_message.hpp"

// Reverses Content-Encoding. Supported codings: identity, gzip, x-gzip,
// deflate (zlib-wrapped or raw) and br. A comma-separated list is undone from
// the last coding to the first.
class ContentDecoder
{
   public:
    // std::nullopt for unknown codings or corrupt data
    static std::optional<Bytes> decode(const std::string& encoding, const Bytes& data);

    static bool isSupported(const std::string& coding);

   private:
    static std::optional<Bytes> decodeOne(const std::string& coding, const Bytes& data);
    static std::optional<Bytes> inflateBytes(const Bytes& data, int window_bits);
    static std::optional<Bytes> brotliDecompress(const Bytes& data);
};

#endif  // CONTENT_DECODER_HPP
