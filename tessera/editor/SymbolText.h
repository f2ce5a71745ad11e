#pragma once

#include <string>
#include <string_view>

namespace Tessera {

// Element symbols are stored with subscript digits, "•" and "×". The
// inspector edits them in plain ASCII: digits, '+' and '@'.
std::string symbolToEditable(std::string_view stored);
std::string symbolFromEditable(std::string_view edited);

} // namespace Tessera
