#include "license_compare.hpp"

#include <cctype>
#include <unordered_map>

namespace
{

const std::unordered_map<std::string, std::string> EQUIVALENT_WORDS = {
    {"acknowledgement", "acknowledgment"},
    {"analogue", "analog"},
    {"authorisation", "authorization"},
    {"authorised", "authorized"},
    {"behaviour", "behavior"},
    {"licence", "license"},
    {"licences", "licenses"},
    {"licenced", "licensed"},
    {"licencee", "licensee"},
    {"licencor", "licensor"},
    {"organisation", "organization"},
    {"practise", "practice"},
    {"sublicence", "sublicense"},
    {"https", "http"},
};

bool isWordByte(unsigned char c)
{
    return std::isalnum(c) || c >= 0x80;
}

void pushToken(std::string& token, std::vector<std::string>& tokens)
{
    if(token.empty())
    {
        return;
    }
    auto it = EQUIVALENT_WORDS.find(token);
    if(it != EQUIVALENT_WORDS.end())
    {
        tokens.push_back(it->second);
    }
    else
    {
        tokens.push_back(std::move(token));
    }
    token.clear();
}

} // namespace

namespace license_compare
{

std::vector<std::string> tokenize(std::string_view text)
{
    std::vector<std::string> tokens;
    std::string token;
    size_t i = 0;
    while(i < text.size())
    {
        unsigned char c = static_cast<unsigned char>(text[i]);
        // “©” is the same as “(c)”, which tokenizes to “c”.
        if(text.substr(i, 2) == "\xC2\xA9")
        {
            pushToken(token, tokens);
            tokens.emplace_back("c");
            i += 2;
            continue;
        }
        // U+2000 to U+206F (dashes, curly quotes, ellipsis, special
        // spaces) are punctuation.
        if(c == 0xE2 && i + 2 < text.size() &&
           (static_cast<unsigned char>(text[i + 1]) == 0x80 ||
            static_cast<unsigned char>(text[i + 1]) == 0x81))
        {
            pushToken(token, tokens);
            i += 3;
            continue;
        }
        // Non-breaking space.
        if(text.substr(i, 2) == "\xC2\xA0")
        {
            pushToken(token, tokens);
            i += 2;
            continue;
        }

        if(isWordByte(c))
        {
            token.push_back(static_cast<char>(std::tolower(c)));
        }
        else
        {
            pushToken(token, tokens);
        }
        ++i;
    }
    pushToken(token, tokens);
    return tokens;
}

bool isLicenseTextEquivalent(std::string_view a, std::string_view b)
{
    return tokenize(a) == tokenize(b);
}

} // namespace license_compare
