#ifndef INPUT_SOURCE_HPP
#define INPUT_SOURCE_HPP
#include "Alignment.hpp"
#include "FilterReport.hpp"
#include <iosfwd>
#include <string>
#include <variant>

/**
 * @brief A PHYLIP-like file. The first line is a header, every other non-blank line is "<specimen> <sequence>".
 */
struct PhylipSource {
    std::string path;

    Alignment normalize(FilterReport& report) const;
    static Alignment parse(std::istream& in);
};

/**
 * @brief A VCF file. Only single-base REF/ALT records are turned into columns, other records are tallied.
 */
struct VcfSource {
    std::string path;

    Alignment normalize(FilterReport& report) const;
    static Alignment parse(std::istream& in, FilterReport& report);
};

using InputSource = std::variant<PhylipSource, VcfSource>;

Alignment normalizeInput(const InputSource& source, FilterReport& report);
const std::string& inputPath(const InputSource& source);

#endif
