#pragma once
#include <stdexcept>
#include <string>

namespace pagestream
{
class InvalidConfiguration : public std::invalid_argument
{
  public:
    explicit InvalidConfiguration(const std::string &what)
        : std::invalid_argument("invalid configuration: " + what)
    {
    }
};
}  // namespace pagestream
