#ifndef escape_hpp
#define escape_hpp

#include <string>
#include <string_view>

namespace xembly {

/// @brief Escapes the given text for use between the quotes of an attribute
///   literal.
/// @details Characters below space become decimal numeric entities
///   (<code>&amp;#9;</code>). Quote, ampersand, apostrophe, less-than and
///   greater-than become their named entities. Everything else is copied.
/// @note This doesn't check legality and never fails.
/// @see unescape.
auto escape(std::string_view text) -> std::string;

}

#endif /* escape_hpp */
