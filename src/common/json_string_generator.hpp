// src/common/json_string_generator.hpp
#pragma once

#include <string>

#include <boost/spirit/include/karma.hpp>

namespace wk
{

    // Quoted, escaped JSON string. Bytes >= 0x80 pass through (UTF-8).
    template <typename Iterator>
    struct json_string_generator : boost::spirit::karma::grammar<Iterator, std::string()>
    {
        json_string_generator() : json_string_generator::base_type(string)
        {
            namespace standard = boost::spirit::standard;

            string = ('\"'
                      << *(&standard::char_('\b') << "\\b"
                           | &standard::char_('\t') << "\\t"
                           | &standard::char_('\n') << "\\n"
                           | &standard::char_('\f') << "\\f"
                           | &standard::char_('\r') << "\\r"
                           | &standard::char_('\"') << "\\\""
                           | &standard::char_('\\') << "\\\\"
                           | standard::char_)
                      << '\"');
        }

        boost::spirit::karma::rule<Iterator, std::string()> string;
    };

} // namespace wk
