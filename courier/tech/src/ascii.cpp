#include "courier/ascii.hpp"

#include <string>
#include <string_view>

namespace courier {

std::string ToLower(std::string_view str) {
  std::string ret(str);
  for (char& ch : ret) {
    ch = tolower(ch);
  }
  return ret;
}

std::string ToUpper(std::string_view str) {
  std::string ret(str);
  for (char& ch : ret) {
    ch = toupper(ch);
  }
  return ret;
}

}  // namespace courier
