#include "markup_normalizer.hpp"

#include "html_text.hpp"

namespace markup_normalizer
{

std::string normalizeText(const std::string& text, bool is_html)
{
    if(!is_html)
    {
        return text;
    }
    return HtmlText::toPlainText(text);
}

std::string normalizeHeader(const std::string& text)
{
    return HtmlText::unescapeEntities(text);
}

} // namespace markup_normalizer
