#include <ostream>

#include "location.hpp"

auto operator<<(std::ostream& os, const location& l) -> std::ostream&
{
    if (!l.filename.empty()) {
        os << l.filename << ':';
    }
    return os << l.line << ':' << l.column;
}
