#include "textdetector.hpp"

#include <cstdint>
#include <fstream>
#include <string>

namespace {

bool isPrintable(uint32_t cp) {
    if (cp == '\t' || cp == '\n' || cp == '\r' || cp == '\v' || cp == '\f') {
        return true;
    }
    if (cp < 0x20 || cp == 0x7F) {
        return false;
    }
    // C1 control block
    if (cp >= 0x80 && cp < 0xA0) {
        return false;
    }
    return true;
}

} // namespace

double TextDetector::printableRatio(std::string_view sample, bool truncated) {
    std::size_t total = 0;
    std::size_t printable = 0;
    std::size_t i = 0;
    const std::size_t n = sample.size();

    while (i < n) {
        const auto lead = static_cast<unsigned char>(sample[i]);
        uint32_t cp = 0;
        std::size_t len = 0;

        if (lead < 0x80) {
            cp = lead;
            len = 1;
        } else if ((lead & 0xE0) == 0xC0 && lead >= 0xC2) {
            cp = lead & 0x1F;
            len = 2;
        } else if ((lead & 0xF0) == 0xE0) {
            cp = lead & 0x0F;
            len = 3;
        } else if ((lead & 0xF8) == 0xF0 && lead <= 0xF4) {
            cp = lead & 0x07;
            len = 4;
        } else {
            return -1.0;
        }

        if (i + len > n) {
            // a sequence cut off by the sample boundary is not an error
            if (truncated) {
                break;
            }
            return -1.0;
        }

        for (std::size_t k = 1; k < len; ++k) {
            const auto c = static_cast<unsigned char>(sample[i + k]);
            if ((c & 0xC0) != 0x80) {
                return -1.0;
            }
            cp = (cp << 6) | (c & 0x3F);
        }

        // overlong forms, surrogates and values past U+10FFFF
        if ((len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000) ||
            (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
            return -1.0;
        }

        ++total;
        if (isPrintable(cp)) {
            ++printable;
        }
        i += len;
    }

    if (total == 0) {
        return 1.0;
    }
    return static_cast<double>(printable) / static_cast<double>(total);
}

bool TextDetector::isText(std::string_view sample, bool truncated) const {
    if (sample.empty()) {
        return true;
    }
    const double ratio = printableRatio(sample, truncated);
    return ratio >= 0.0 && ratio >= m_minPrintableRatio;
}

bool TextDetector::isTextFile(const std::filesystem::path& path) const {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return false;
    }

    std::string buffer(SAMPLE_SIZE + 1, '\0');
    file.read(&buffer[0], static_cast<std::streamsize>(buffer.size()));
    if (file.bad()) {
        return false;
    }
    const auto got = static_cast<std::size_t>(file.gcount());

    const bool truncated = got > SAMPLE_SIZE;
    buffer.resize(truncated ? SAMPLE_SIZE : got);
    return isText(buffer, truncated);
}
