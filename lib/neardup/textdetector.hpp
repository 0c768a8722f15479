#ifndef TEXTDETECTOR_HPP
#define TEXTDETECTOR_HPP

#include <cstddef>
#include <filesystem>
#include <string_view>

/**
 * @brief Decides whether a file holds text worth comparing
 *
 * Only the head of the file is inspected. It must decode as UTF-8, and the
 * share of printable or whitespace code points must reach the configured
 * ratio. Empty files count as text.
 */
class TextDetector {
public:
    static constexpr std::size_t SAMPLE_SIZE = 8 * 1024;

    explicit TextDetector(double minPrintableRatio = 0.8)
        : m_minPrintableRatio(minPrintableRatio) {}

    /**
     * @brief Check the first SAMPLE_SIZE bytes of a file
     * @return false for binary content and for files that cannot be read
     */
    bool isTextFile(const std::filesystem::path& path) const;

    /**
     * @brief Check a sample held in memory
     * @param truncated The sample was cut from a longer file, so a multi-byte
     *                  sequence at its very end may be incomplete
     */
    bool isText(std::string_view sample, bool truncated = false) const;

    /**
     * @brief Share of printable or whitespace code points
     * @return ratio in [0, 1], or a negative value if sample is not UTF-8
     */
    static double printableRatio(std::string_view sample, bool truncated = false);

private:
    double m_minPrintableRatio;
};

#endif // TEXTDETECTOR_HPP
