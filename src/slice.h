#ifndef CCM_LOOKAHEAD_SLICE_H
#define CCM_LOOKAHEAD_SLICE_H

#include <cstddef>
#include <type_traits>

namespace ccm::lookahead {

// A non-owning view over a contiguous run of elements. A Slice handed out by
// a LookaheadBuffer is only valid until the next call that modifies that
// buffer.
template<typename T>
class Slice {
public:
   using value_type = std::remove_const_t<T>;
   using iterator = T *;

   Slice() = default;

   Slice(T *data, std::size_t size)
      : ptr(data),
        len(size)
      { }

   // Slice<T> -> Slice<const T>
   template<typename U,
            typename = std::enable_if_t<std::is_same_v<const U, T>
                                        && !std::is_same_v<U, T>>>
   Slice(const Slice<U> &other)
      : ptr(other.data()),
        len(other.size())
      { }

   std::size_t size() const { return len; }
   bool empty() const { return len == 0; }
   T *data() const { return ptr; }

   T &operator[](std::size_t index) const { return ptr[index]; }
   T &front() const { return ptr[0]; }
   T &back() const { return ptr[len - 1]; }

   iterator begin() const { return ptr; }
   iterator end() const { return ptr + len; }

private:
   T *ptr = nullptr;
   std::size_t len = 0;
};

} // namespace ccm::lookahead

#endif
