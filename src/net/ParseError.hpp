//
// ParseError.hpp
//

#ifndef UNOARBITER_PARSEERROR_HPP
#define UNOARBITER_PARSEERROR_HPP

#include <string>

namespace uno::net
{
    // Lightweight local parse error, returned by value from every decoder
    struct ParseError
    {
        std::string message;
    };
}

#endif //UNOARBITER_PARSEERROR_HPP
