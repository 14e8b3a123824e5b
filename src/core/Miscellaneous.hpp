#ifndef MISC_HPP
#define MISC_HPP
#include <boost/algorithm/string.hpp>
#include <string>
#include <vector>

/**
 * @brief Split a line on runs of spaces and tabs, dropping leading and trailing whitespace
 */
inline std::vector<std::string> tokenize(const std::string& line){
    std::vector<std::string> tokens;
    std::string trimmed = boost::algorithm::trim_copy(line);
    if(trimmed.empty())
        return tokens;

    boost::algorithm::split(tokens, trimmed, boost::algorithm::is_any_of(" \t\r\n"), boost::algorithm::token_compress_on);
    return tokens;
}

/**
 * @brief Split a field on a single delimiter, keeping empty pieces
 */
inline std::vector<std::string> splitField(const std::string& field, char delimiter){
    std::vector<std::string> pieces;
    boost::algorithm::split(pieces, field, [delimiter](char c){ return c == delimiter; });
    return pieces;
}

inline bool isBlank(const std::string& line){
    return boost::algorithm::all(line, boost::algorithm::is_space());
}

#endif
