#include "content_decoder.hpp"

#include <brotli/decode.h>
#include <zlib.h>

#include <algorithm>
#include <cctype>
#include <vector>

#include "logger.hpp"

constexpr size_t DECODE_CHUNK_SIZE = 16 * 1024;
constexpr int ZLIB_AUTO_WINDOW = 15 + 32;  // accept gzip or zlib header
constexpr int ZLIB_WINDOW = 15;
constexpr int RAW_DEFLATE_WINDOW = -15;

namespace
{
std::string trim_lower(const std::string& text)
{
    size_t begin = text.find_first_not_of(" \t");
    if (begin == std::string::npos)
    {
        return "";
    }
    size_t end = text.find_last_not_of(" \t");
    std::string out = text.substr(begin, end - begin + 1);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::vector<std::string> split_codings(const std::string& encoding)
{
    std::vector<std::string> codings;
    size_t start = 0;
    while (start <= encoding.size())
    {
        size_t comma = encoding.find(',', start);
        if (comma == std::string::npos)
        {
            comma = encoding.size();
        }
        std::string coding = trim_lower(encoding.substr(start, comma - start));
        if (!coding.empty())
        {
            codings.push_back(coding);
        }
        start = comma + 1;
    }
    return codings;
}

bool starts_with_gzip_magic(const Bytef* data, uInt size)
{
    return size >= 2 && data[0] == 0x1f && data[1] == 0x8b;
}
}  // namespace

bool ContentDecoder::isSupported(const std::string& coding)
{
    std::string c = trim_lower(coding);
    return c == "identity" || c == "gzip" || c == "x-gzip" || c == "deflate" || c == "br";
}

std::optional<Bytes> ContentDecoder::decode(const std::string& encoding, const Bytes& data)
{
    std::vector<std::string> codings = split_codings(encoding);
    if (codings.empty())
    {
        return std::nullopt;
    }

    Bytes current = data;
    for (auto it = codings.rbegin(); it != codings.rend(); ++it)
    {
        auto decoded = decodeOne(*it, current);
        if (!decoded)
        {
            LOG_DEBUG("Content-Encoding '" << *it << "' could not be decoded ("
                      << current.size() << " bytes)");
            return std::nullopt;
        }
        current = std::move(*decoded);
    }
    return current;
}

std::optional<Bytes> ContentDecoder::decodeOne(const std::string& coding, const Bytes& data)
{
    if (!isSupported(coding))
    {
        return std::nullopt;
    }
    // An empty body is valid under every supported coding
    if (coding == "identity" || data.empty())
    {
        return data;
    }
    if (coding == "gzip" || coding == "x-gzip")
    {
        return inflateBytes(data, ZLIB_AUTO_WINDOW);
    }
    if (coding == "deflate")
    {
        // Servers disagree on whether deflate carries the zlib wrapper
        auto wrapped = inflateBytes(data, ZLIB_WINDOW);
        if (wrapped)
        {
            return wrapped;
        }
        return inflateBytes(data, RAW_DEFLATE_WINDOW);
    }
    return brotliDecompress(data);
}

std::optional<Bytes> ContentDecoder::inflateBytes(const Bytes& data, int window_bits)
{
    z_stream strm{};
    if (inflateInit2(&strm, window_bits) != Z_OK)
    {
        LOG_WARNING("inflateInit2 failed");
        return std::nullopt;
    }

    Bytes out;
    std::vector<Bytef> chunk(DECODE_CHUNK_SIZE);
    strm.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(data.data()));
    strm.avail_in = static_cast<uInt>(data.size());

    int ret = Z_OK;
    for (;;)
    {
        strm.next_out = chunk.data();
        strm.avail_out = static_cast<uInt>(chunk.size());
        ret = ::inflate(&strm, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END)
        {
            break;
        }
        out.insert(out.end(), chunk.data(), chunk.data() + (chunk.size() - strm.avail_out));

        if (ret == Z_STREAM_END)
        {
            if (strm.avail_in == 0)
            {
                break;
            }
            // A gzip body may hold several members back to back
            if (window_bits == ZLIB_AUTO_WINDOW &&
                starts_with_gzip_magic(strm.next_in, strm.avail_in))
            {
                if (inflateReset(&strm) != Z_OK)
                {
                    ret = Z_STREAM_ERROR;
                    break;
                }
                continue;
            }
            // Trailing bytes after the stream: not a clean encoding
            ret = Z_DATA_ERROR;
            break;
        }

        // No progress and no input left: truncated stream
        if (strm.avail_in == 0 && strm.avail_out != 0)
        {
            ret = Z_DATA_ERROR;
            break;
        }
    }

    inflateEnd(&strm);
    if (ret != Z_STREAM_END)
    {
        return std::nullopt;
    }
    return out;
}

std::optional<Bytes> ContentDecoder::brotliDecompress(const Bytes& data)
{
    BrotliDecoderState* state = BrotliDecoderCreateInstance(nullptr, nullptr, nullptr);
    if (state == nullptr)
    {
        LOG_WARNING("BrotliDecoderCreateInstance failed");
        return std::nullopt;
    }

    Bytes out;
    std::vector<uint8_t> chunk(DECODE_CHUNK_SIZE);
    size_t available_in = data.size();
    const uint8_t* next_in = data.data();

    BrotliDecoderResult result = BROTLI_DECODER_RESULT_NEEDS_MORE_OUTPUT;
    while (result == BROTLI_DECODER_RESULT_NEEDS_MORE_OUTPUT)
    {
        size_t available_out = chunk.size();
        uint8_t* next_out = chunk.data();
        result = BrotliDecoderDecompressStream(state, &available_in, &next_in, &available_out,
                                               &next_out, nullptr);
        out.insert(out.end(), chunk.data(), chunk.data() + (chunk.size() - available_out));
    }

    BrotliDecoderDestroyInstance(state);
    if (result != BROTLI_DECODER_RESULT_SUCCESS || available_in != 0)
    {
        return std::nullopt;
    }
    return out;
}
