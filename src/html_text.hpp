#pragma once

#include <string>
#include <string_view>

class HtmlText
{
public:
    // Render an HTML fragment as plain text. Text is kept verbatim
    // with entities decoded, <br> becomes a line break, and block
    // elements go on their own lines. Input without markup comes out
    // unchanged apart from entity decoding.
    static std::string toPlainText(const std::string& html);

    // Decode HTML character references, named and numeric, with
    // gumbo's full entity table. Markup is not interpreted, and
    // anything that is not a reference is left alone. Line endings
    // come out as “\n”.
    static std::string unescapeEntities(std::string_view input);
};
