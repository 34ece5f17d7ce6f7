#pragma once
#include <cstddef>
#include <string>
#include "sidcore/SID.h"

namespace sidcore
{
typedef std::basic_string<NativeChar> native_string;

/// Encodes UTF-8 text as native UTF-16. Malformed sequences become U+FFFD.
native_string Utf8ToNative(std::string const &str);

/// Decodes a null-terminated native UTF-16 string to UTF-8.
/// Unpaired surrogates become U+FFFD.
std::string NativeToUtf8(NativeChar const *str);

/// Same as above, but reads at most \p maxLength characters.
std::string NativeToUtf8(NativeChar const *str, size_t maxLength);
} // namespace sidcore
