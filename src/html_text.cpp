#include "html_text.hpp"

#include <unordered_set>

#include <gumbo.h>

namespace
{

const std::unordered_set<std::string> BLOCK_TAGS = {
    "address", "article", "blockquote", "dd", "div", "dl", "dt", "footer",
    "h1", "h2", "h3", "h4", "h5", "h6", "header", "hr", "li", "ol", "p",
    "pre", "section", "table", "tr", "ul"
};

const std::unordered_set<std::string> DROPPED_TAGS = {
    "script", "style", "head", "title", "iframe", "object", "embed",
    "applet", "meta", "link", "template"
};

// Collects text, turning block boundaries into single line breaks.
class TextBuilder
{
public:
    void text(std::string_view s, bool whitespace_only)
    {
        if(pending_break)
        {
            if(whitespace_only)
            {
                return;
            }
            breakLine();
        }
        out.append(s);
    }

    void lineBreak()
    {
        out.push_back('\n');
        pending_break = false;
    }

    void blockBoundary()
    {
        pending_break = true;
    }

    std::string str() &&
    {
        return std::move(out);
    }

private:
    void breakLine()
    {
        if(!out.empty() && out.back() != '\n')
        {
            out.push_back('\n');
        }
        pending_break = false;
    }

    std::string out;
    bool pending_break = false;
};

void traverse(GumboNode* node, TextBuilder& builder)
{
    if(node->type == GUMBO_NODE_TEXT || node->type == GUMBO_NODE_CDATA)
    {
        builder.text(node->v.text.text, false);
        return;
    }
    else if(node->type == GUMBO_NODE_WHITESPACE)
    {
        builder.text(node->v.text.text, true);
        return;
    }
    else if(node->type != GUMBO_NODE_ELEMENT)
    {
        return;
    }

    std::string tag = gumbo_normalized_tagname(node->v.element.tag);
    if(DROPPED_TAGS.count(tag))
    {
        return;
    }
    if(tag == "br")
    {
        builder.lineBreak();
        return;
    }

    bool block = BLOCK_TAGS.count(tag);
    if(block)
    {
        builder.blockBoundary();
    }
    GumboVector* children = &node->v.element.children;
    for(unsigned int i = 0; i < children->length; ++i)
    {
        traverse(static_cast<GumboNode*>(children->data[i]), builder);
    }
    if(block)
    {
        builder.blockBoundary();
    }
}

GumboNode* findChild(GumboNode* node, GumboTag tag)
{
    if(node == nullptr || node->type != GUMBO_NODE_ELEMENT)
    {
        return nullptr;
    }
    GumboVector* children = &node->v.element.children;
    for(unsigned int i = 0; i < children->length; ++i)
    {
        GumboNode* child = static_cast<GumboNode*>(children->data[i]);
        if(child->type == GUMBO_NODE_ELEMENT && child->v.element.tag == tag)
        {
            return child;
        }
    }
    return nullptr;
}

// Decode the character references in “text”, which must not contain
// “</”. As the content of a <textarea> it is tokenized as RCDATA, so
// references are decoded and tags are kept as text.
std::string decodeRcdata(std::string_view text)
{
    if(text.empty())
    {
        return {};
    }
    // The parser drops a line feed right after the start tag.
    std::string html = "<textarea>\n";
    html.append(text);
    GumboOutput* output = gumbo_parse_with_options(
        &kGumboDefaultOptions, html.data(), html.size());

    std::string result;
    GumboNode* textarea = findChild(findChild(output->root, GUMBO_TAG_BODY),
                                    GUMBO_TAG_TEXTAREA);
    if(textarea != nullptr)
    {
        GumboVector* children = &textarea->v.element.children;
        for(unsigned int i = 0; i < children->length; ++i)
        {
            GumboNode* child = static_cast<GumboNode*>(children->data[i]);
            if(child->type == GUMBO_NODE_TEXT ||
               child->type == GUMBO_NODE_WHITESPACE)
            {
                result += child->v.text.text;
            }
        }
    }
    gumbo_destroy_output(&kGumboDefaultOptions, output);
    return result;
}

} // namespace

std::string HtmlText::toPlainText(const std::string& html)
{
    GumboOutput* output = gumbo_parse(html.c_str());

    // Gumbo wraps everything in <html><head>...</head><body>...</body></html>.
    GumboNode* root = output->root;
    GumboNode* body = findChild(root, GUMBO_TAG_BODY);

    TextBuilder builder;
    traverse(body == nullptr ? root : body, builder);
    gumbo_destroy_output(&kGumboDefaultOptions, output);
    return std::move(builder).str();
}

std::string HtmlText::unescapeEntities(std::string_view input)
{
    // Only “</” could end the RCDATA section, so decode around it.
    std::string result;
    result.reserve(input.size());
    size_t pos = 0;
    while(true)
    {
        size_t end = input.find("</", pos);
        if(end == std::string_view::npos)
        {
            result += decodeRcdata(input.substr(pos));
            break;
        }
        result += decodeRcdata(input.substr(pos, end - pos));
        result += "</";
        pos = end + 2;
    }
    return result;
}
