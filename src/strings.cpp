#include "stdafx.h"

namespace sidcore
{
#ifdef _WIN32
// Invalid input becomes U+FFFD: no MB_ERR_INVALID_CHARS or WC_ERR_INVALID_CHARS.
native_string Utf8ToNative(std::string const &str)
{
    if (str.empty())
    {
        return native_string();
    }

    int len = MultiByteToWideChar(CP_UTF8, 0, str.data(), static_cast<int>(str.size()), nullptr, 0);
    if (len <= 0)
    {
        throw SidException(GetLastError(), "MultiByteToWideChar failed");
    }
    native_string result(len, 0);
    len = MultiByteToWideChar(CP_UTF8, 0, str.data(), static_cast<int>(str.size()), &result[0], len);
    if (len <= 0)
    {
        throw SidException(GetLastError(), "MultiByteToWideChar failed");
    }
    result.resize(len);
    return result;
}

std::string NativeToUtf8(NativeChar const *str, size_t maxLength)
{
    if (str == nullptr)
    {
        return std::string();
    }
    size_t length = 0;
    while (length < maxLength && str[length] != 0)
    {
        ++length;
    }
    if (length == 0)
    {
        return std::string();
    }

    int len = WideCharToMultiByte(CP_UTF8, 0, str, static_cast<int>(length), nullptr, 0, nullptr, nullptr);
    if (len <= 0)
    {
        throw SidException(GetLastError(), "WideCharToMultiByte failed");
    }
    std::string result(len, '\0');
    len = WideCharToMultiByte(CP_UTF8, 0, str, static_cast<int>(length), &result[0], len, nullptr, nullptr);
    if (len <= 0)
    {
        throw SidException(GetLastError(), "WideCharToMultiByte failed");
    }
    result.resize(len);
    return result;
}
#else
namespace
{
constexpr char32_t kReplacementChar = 0xFFFD;

void AppendUtf8(std::string &out, char32_t cp)
{
    if (cp < 0x80)
    {
        out.push_back(static_cast<char>(cp));
    }
    else if (cp < 0x800)
    {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else if (cp < 0x10000)
    {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else
    {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

void AppendUtf16(native_string &out, char32_t cp)
{
    if (cp < 0x10000)
    {
        out.push_back(static_cast<NativeChar>(cp));
    }
    else
    {
        cp -= 0x10000;
        out.push_back(static_cast<NativeChar>(0xD800 | (cp >> 10)));
        out.push_back(static_cast<NativeChar>(0xDC00 | (cp & 0x3FF)));
    }
}

bool IsHighSurrogate(char32_t unit)
{
    return unit >= 0xD800 && unit <= 0xDBFF;
}

bool IsLowSurrogate(char32_t unit)
{
    return unit >= 0xDC00 && unit <= 0xDFFF;
}
} // namespace

native_string Utf8ToNative(std::string const &str)
{
    native_string result;
    result.reserve(str.size());

    size_t i = 0;
    while (i < str.size())
    {
        auto lead = static_cast<unsigned char>(str[i]);
        char32_t cp;
        size_t extra;
        char32_t min;
        if (lead < 0x80)
        {
            cp = lead;
            extra = 0;
            min = 0;
        }
        else if ((lead & 0xE0) == 0xC0)
        {
            cp = lead & 0x1F;
            extra = 1;
            min = 0x80;
        }
        else if ((lead & 0xF0) == 0xE0)
        {
            cp = lead & 0x0F;
            extra = 2;
            min = 0x800;
        }
        else if ((lead & 0xF8) == 0xF0)
        {
            cp = lead & 0x07;
            extra = 3;
            min = 0x10000;
        }
        else
        {
            AppendUtf16(result, kReplacementChar);
            ++i;
            continue;
        }

        size_t consumed = 1;
        bool valid = true;
        for (; consumed <= extra; ++consumed)
        {
            if (i + consumed >= str.size())
            {
                valid = false;
                break;
            }
            auto cont = static_cast<unsigned char>(str[i + consumed]);
            if ((cont & 0xC0) != 0x80)
            {
                valid = false;
                break;
            }
            cp = (cp << 6) | (cont & 0x3F);
        }

        // overlong encodings, surrogates and values past U+10FFFF are rejected
        if (!valid || cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
        {
            AppendUtf16(result, kReplacementChar);
            i += consumed;
            continue;
        }

        AppendUtf16(result, cp);
        i += consumed;
    }
    return result;
}

std::string NativeToUtf8(NativeChar const *str, size_t maxLength)
{
    std::string result;
    if (str == nullptr)
    {
        return result;
    }

    for (size_t i = 0; i < maxLength && str[i] != 0; ++i)
    {
        char32_t unit = static_cast<char16_t>(str[i]);
        if (IsHighSurrogate(unit))
        {
            if (i + 1 < maxLength && IsLowSurrogate(static_cast<char16_t>(str[i + 1])))
            {
                char32_t low = static_cast<char16_t>(str[i + 1]);
                AppendUtf8(result, 0x10000 + ((unit - 0xD800) << 10) + (low - 0xDC00));
                ++i;
            }
            else
            {
                AppendUtf8(result, kReplacementChar);
            }
        }
        else if (IsLowSurrogate(unit))
        {
            AppendUtf8(result, kReplacementChar);
        }
        else
        {
            AppendUtf8(result, unit);
        }
    }
    return result;
}

#endif

std::string NativeToUtf8(NativeChar const *str)
{
    return NativeToUtf8(str, static_cast<size_t>(-1));
}
} // namespace sidcore
