#ifndef CCM_LOOKAHEAD_LOOKAHEAD_BUFFER_H
#define CCM_LOOKAHEAD_LOOKAHEAD_BUFFER_H

#include "exception.h"
#include "istream-source.h"
#include "range.h"
#include "ring-deque.h"
#include "slice.h"
#include "sources.h"

#include <cstddef>
#include <iterator>
#include <limits>
#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>

namespace ccm::lookahead {

// Wraps a source and keeps the items that have been looked at but not yet
// consumed. Items are pulled from the source only when an operation needs
// them, so the source may be infinite.
//
// The buffer followed by whatever the source has left is always the original
// sequence, minus the popped items, plus the pushed items in front (last
// pushed first).
//
// Pointers and slices returned by the peek functions stay valid until the
// next call that can change the buffer (pop, push, any peek, reserve).
template<typename Source>
class LookaheadBuffer {
public:
   using Item = SourceItem<Source>;

   class Iterator {
   public:
      using iterator_category = std::input_iterator_tag;
      using value_type = Item;
      using difference_type = std::ptrdiff_t;
      using pointer = Item *;
      using reference = Item &;

      Iterator() = default;

      explicit Iterator(LookaheadBuffer *owner)
         : owner(owner),
           current(owner->pop())
         { }

      reference operator*() { return *current; }
      pointer operator->() { return &*current; }

      Iterator &operator++() {
         current = owner->pop();
         return *this;
      }

      // Only the end position is meaningful to compare against.
      bool operator==(const Iterator &other) const {
         return current.has_value() == other.current.has_value();
      }

      bool operator!=(const Iterator &other) const {
         return !(*this == other);
      }

   private:
      LookaheadBuffer *owner = nullptr;
      std::optional<Item> current;
   };

   explicit LookaheadBuffer(Source source)
      : source(std::move(source))
      { }

   // Puts an item in front of everything else.
   void push(Item item) {
      buffer.pushFront(std::move(item));
   }

   std::optional<Item> pop();

   // Same as pop(). Lets a LookaheadBuffer act as the source of another one.
   std::optional<Item> next() {
      return pop();
   }

   // The item that the (n+1)-th pop() would return, or nullptr if the source
   // runs out first.
   const Item *peek(std::size_t n=0) {
      return peekMut(n);
   }

   Item *peekMut(std::size_t n=0);

   // The items at the positions covered by r. If the source ends inside the
   // range, the slice is cut short; if it ends before the range even starts,
   // there is no slice. An unbounded end reads the whole source.
   std::optional<Slice<const Item>> peekSlice(const Range &r) {
      std::optional<Slice<Item>> res = peekSliceMut(r);
      if (!res) {
         return std::nullopt;
      }
      return Slice<const Item>(*res);
   }

   std::optional<Slice<Item>> peekSliceMut(const Range &r);

   // Number of items already pulled from the source (or pushed) and not yet
   // popped.
   std::size_t buffered() const {
      return buffer.size();
   }

   void reserve(std::size_t n) {
      buffer.reserve(n);
   }

   // Exact number of items left, pushed items included. Only available when
   // the source can tell how many items it has left.
   template<typename S = Source,
            typename = std::enable_if_t<hasRemaining<S>>>
   std::size_t remaining() const {
      return buffer.size() + source.remaining();
   }

   template<typename S = Source,
            typename = std::enable_if_t<hasRemaining<S>>>
   std::size_t size() const {
      return remaining();
   }

   // Iterating consumes the items, exactly like calling pop() repeatedly. The
   // iterator holds the item it points at, so begin() already pops one item
   // even if it is never dereferenced, and leaving a loop early drops the
   // current item.
   Iterator begin() {
      return Iterator(this);
   }

   Iterator end() {
      return Iterator();
   }

   friend std::ostream &operator<<(std::ostream &out,
                                   const LookaheadBuffer &lb)
   {
      out << "LookaheadBuffer{buffered=[";
      for (std::size_t i = 0; i < lb.buffer.size(); ++i) {
         if (i > 0) {
            out << ", ";
         }
         out << lb.buffer[i];
      }
      return out << "]}";
   }

private:
   std::size_t prepareN(std::size_t n);
   void prepare(const Range &r);
   void prepareAll();

   Source source;
   RingDeque<Item> buffer;
};

template<typename Source>
std::optional<typename LookaheadBuffer<Source>::Item>
LookaheadBuffer<Source>::pop() {
   if (buffer.empty()) {
      return source.next();
   }
   return buffer.popFront();
}

template<typename Source>
typename LookaheadBuffer<Source>::Item *
LookaheadBuffer<Source>::peekMut(std::size_t n) {
   // No source can supply SIZE_MAX + 1 items.
   if (n == std::numeric_limits<std::size_t>::max()
       || prepareN(n + 1) != 0)
   {
      return nullptr;
   }
   return &buffer[n];
}

template<typename Source>
std::optional<Slice<typename LookaheadBuffer<Source>::Item>>
LookaheadBuffer<Source>::peekSliceMut(const Range &r) {
   std::optional<std::size_t> first = startIndex(r);
   if (!first) {
      return std::nullopt;
   }
   std::size_t start = *first;
   std::optional<std::size_t> end = endIndex(r);
   if (end && start > *end) {
      throw InvalidRange("LookaheadBuffer::peekSlice(): range starts at "
                         + std::to_string(start) + " but ends at "
                         + std::to_string(*end),
                         start, *end);
   }

   prepare(r);

   Item *data = buffer.makeContiguous();
   std::size_t len = buffer.size();
   if (start > len) {
      return std::nullopt;
   }
   std::size_t stop = end && *end < len ? *end : len;
   return Slice<Item>(data + start, stop - start);
}

// Pulls until n items are buffered. Returns how many are still missing when
// the source ran out, 0 on success.
template<typename Source>
std::size_t LookaheadBuffer<Source>::prepareN(std::size_t n) {
   while (buffer.size() < n) {
      std::optional<Item> item = source.next();
      if (!item) {
         break;
      }
      buffer.pushBack(std::move(*item));
   }
   return n > buffer.size() ? n - buffer.size() : 0;
}

// Pulls just enough to cover the end of r.
template<typename Source>
void LookaheadBuffer<Source>::prepare(const Range &r) {
   std::optional<std::size_t> end = endIndex(r);
   if (!end) {
      prepareAll();
      return;
   }

   std::size_t extra = *end > buffer.size() ? *end - buffer.size() : 0;
   for (; extra > 0; --extra) {
      std::optional<Item> item = source.next();
      if (!item) {
         break;
      }
      buffer.pushBack(std::move(*item));
   }
}

template<typename Source>
void LookaheadBuffer<Source>::prepareAll() {
   for (std::optional<Item> item = source.next(); item; item = source.next()) {
      buffer.pushBack(std::move(*item));
   }
}

template<typename Source>
LookaheadBuffer<Source> makeLookaheadBuffer(Source source) {
   return LookaheadBuffer<Source>(std::move(source));
}

template<typename It>
LookaheadBuffer<IteratorSource<It>> fromRange(It first, It last) {
   return LookaheadBuffer<IteratorSource<It>>(
      IteratorSource<It>(std::move(first), std::move(last)));
}

template<typename Container>
LookaheadBuffer<ContainerSource<std::decay_t<Container>>>
fromContainer(Container &&items) {
   using Source = ContainerSource<std::decay_t<Container>>;
   return LookaheadBuffer<Source>(Source(std::forward<Container>(items)));
}

template<typename Fn>
LookaheadBuffer<GeneratorSource<std::decay_t<Fn>>> fromGenerator(Fn &&fn) {
   using Source = GeneratorSource<std::decay_t<Fn>>;
   return LookaheadBuffer<Source>(Source(std::forward<Fn>(fn)));
}

inline LookaheadBuffer<IStreamSource> fromStream(std::istream &in) {
   return LookaheadBuffer<IStreamSource>(IStreamSource(in));
}

} // namespace ccm::lookahead

#endif
