#ifndef CCM_LOOKAHEAD_RING_DEQUE_H
#define CCM_LOOKAHEAD_RING_DEQUE_H

#include "exception.h"

#include <cstddef>
#include <memory>
#include <type_traits>
#include <utility>

namespace ccm::lookahead {

// A double-ended queue stored in a single circular allocation. Elements can be
// added at either end and removed from the front in constant time, and the
// whole content can be rearranged into one contiguous run on request.
template<typename T>
class RingDeque {
   struct NotCopyable { };

   // Names RingDeque only when T can be copied; otherwise the constructor
   // below is not a copy constructor and copies are deleted.
   using CopySource = std::conditional_t<std::is_copy_constructible_v<T>,
                                         RingDeque, NotCopyable>;

public:
   RingDeque() = default;

   RingDeque(const CopySource &other) {
      if (other.count == 0) {
         return;
      }
      storage = allocate(other.count);
      cap = other.count;
      try {
         for (; count < other.count; ++count) {
            Traits::construct(alloc, storage + count, other[count]);
         }
      }
      catch (...) {
         release();
         throw;
      }
   }

   RingDeque(RingDeque &&other) noexcept
      : storage(std::exchange(other.storage, nullptr)),
        cap(std::exchange(other.cap, 0)),
        head(std::exchange(other.head, 0)),
        count(std::exchange(other.count, 0))
      { }

   RingDeque &operator=(RingDeque other) noexcept {
      swap(other);
      return *this;
   }

   ~RingDeque() {
      release();
   }

   void swap(RingDeque &other) noexcept {
      std::swap(storage, other.storage);
      std::swap(cap, other.cap);
      std::swap(head, other.head);
      std::swap(count, other.count);
   }

   std::size_t size() const { return count; }
   std::size_t capacity() const { return cap; }
   bool empty() const { return count == 0; }

   T &operator[](std::size_t index) { return storage[slot(index)]; }
   const T &operator[](std::size_t index) const {
      return storage[slot(index)];
   }

   T &front() {
      if (empty()) {
         throw Exception("RingDeque::front(): deque is empty");
      }
      return storage[head];
   }

   void pushBack(T value) {
      if (count == cap) {
         grow();
      }
      Traits::construct(alloc, storage + slot(count), std::move(value));
      ++count;
   }

   void pushFront(T value) {
      if (count == cap) {
         grow();
      }
      std::size_t newHead = head == 0 ? cap - 1 : head - 1;
      Traits::construct(alloc, storage + newHead, std::move(value));
      head = newHead;
      ++count;
   }

   T popFront() {
      if (empty()) {
         throw Exception("RingDeque::popFront(): deque is empty");
      }
      T res = std::move(storage[head]);
      Traits::destroy(alloc, storage + head);
      head = head + 1 == cap ? 0 : head + 1;
      --count;
      return res;
   }

   void reserve(std::size_t n) {
      if (n > cap) {
         relocate(n);
      }
   }

   void clear() {
      for (std::size_t i = 0; i < count; ++i) {
         Traits::destroy(alloc, storage + slot(i));
      }
      head = 0;
      count = 0;
   }

   // Rearranges the elements so that element i lives at the returned
   // pointer + i. Logical order is unchanged.
   T *makeContiguous() {
      if (head + count > cap) {
         relocate(cap);
      }
      return storage + head;
   }

private:
   using Alloc = std::allocator<T>;
   using Traits = std::allocator_traits<Alloc>;

   static constexpr std::size_t minCapacity = 4;

   std::size_t slot(std::size_t index) const {
      std::size_t s = head + index;
      return s >= cap ? s - cap : s;
   }

   T *allocate(std::size_t n) {
      return Traits::allocate(alloc, n);
   }

   void grow() {
      relocate(cap < minCapacity ? minCapacity : cap * 2);
   }

   // Moves every element, in logical order, to the front of a fresh
   // allocation of newCap slots.
   void relocate(std::size_t newCap) {
      T *fresh = allocate(newCap);
      std::size_t moved = 0;
      try {
         for (; moved < count; ++moved) {
            Traits::construct(alloc, fresh + moved,
                              std::move_if_noexcept(storage[slot(moved)]));
         }
      }
      catch (...) {
         for (std::size_t i = 0; i < moved; ++i) {
            Traits::destroy(alloc, fresh + i);
         }
         Traits::deallocate(alloc, fresh, newCap);
         throw;
      }

      std::size_t n = count;
      release();
      storage = fresh;
      cap = newCap;
      count = n;
   }

   void release() {
      clear();
      if (storage) {
         Traits::deallocate(alloc, storage, cap);
      }
      storage = nullptr;
      cap = 0;
   }

   Alloc alloc;
   T *storage = nullptr;
   std::size_t cap = 0;
   std::size_t head = 0;
   std::size_t count = 0;
};

} // namespace ccm::lookahead

#endif
