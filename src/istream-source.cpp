#include "istream-source.h"

#include <string>

using namespace std;

namespace ccm::lookahead {

IStreamSource::IStreamSource(istream &in)
   : in(in)
{
}

optional<char> IStreamSource::next() {
   int c = in.get();
   if (c == char_traits<char>::eof()) {
      return nullopt;
   }
   return char_traits<char>::to_char_type(c);
}

}
