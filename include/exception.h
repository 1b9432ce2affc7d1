#ifndef CCM_LOOKAHEAD_EXCEPTION_H
#define CCM_LOOKAHEAD_EXCEPTION_H

#include <cstddef>
#include <string>

namespace ccm::lookahead {

class Exception {
public:
   Exception(const std::string &error)
      : error(error)
      { }

   virtual ~Exception() = default;

   const char *what() const noexcept
      { return error.c_str(); }

private:
   std::string error;
};

// Thrown when a range's lower bound lies past its upper bound. start and end
// are the resolved positions (end is exclusive).
class InvalidRange : public Exception {
public:
   InvalidRange(const std::string &error, std::size_t start, std::size_t end)
      : Exception(error),
        start(start),
        end(end)
      { }

   virtual ~InvalidRange() = default;

   const std::size_t start;
   const std::size_t end;
};

} // namespace ccm::lookahead

#endif
