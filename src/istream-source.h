#ifndef CCM_LOOKAHEAD_ISTREAM_SOURCE_H
#define CCM_LOOKAHEAD_ISTREAM_SOURCE_H

#include <istream>
#include <optional>

namespace ccm::lookahead {

// Yields the characters of a stream until it reaches EOF. The stream is not
// owned and must outlive the source.
class IStreamSource {
public:
   using value_type = char;

   IStreamSource(std::istream &in);

   std::optional<char> next();

private:
   std::istream &in;
};

}

#endif
