#ifndef reserved_hpp
#define reserved_hpp

namespace xembly::reserved {

constexpr auto literal_delimiter = '"';
constexpr auto entity_prefix = '&';
constexpr auto entity_suffix = ';';
constexpr auto numeric_entity_prefix = '#';

/// @brief Code points below this are always written as numeric entities.
constexpr auto first_printable = char32_t{0x20};

constexpr auto charsets_reference =
    "http://www.w3.org/TR/2004/REC-xml11-20040204/#charsets";

}

#endif /* reserved_hpp */
