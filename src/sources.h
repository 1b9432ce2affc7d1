#ifndef CCM_LOOKAHEAD_SOURCES_H
#define CCM_LOOKAHEAD_SOURCES_H

#include <cstddef>
#include <iterator>
#include <optional>
#include <type_traits>
#include <utility>

namespace ccm::lookahead {

// A source is any object with a member
//
//    std::optional<T> next();
//
// returning the next item, or nothing once the sequence is exhausted. A source
// that knows exactly how many items it will still produce may also provide
//
//    std::size_t remaining() const;

template<typename Source>
using SourceItem =
   typename decltype(std::declval<Source &>().next())::value_type;

template<typename Source, typename = void>
struct HasRemaining : std::false_type { };

template<typename Source>
struct HasRemaining<Source,
                    std::void_t<decltype(std::declval<const Source &>()
                                            .remaining())>>
   : std::true_type { };

template<typename Source>
constexpr bool hasRemaining = HasRemaining<Source>::value;

// Yields copies of the elements in [first, last).
template<typename It>
class IteratorSource {
public:
   using value_type = typename std::iterator_traits<It>::value_type;

   IteratorSource(It first, It last)
      : first(std::move(first)),
        last(std::move(last))
      { }

   std::optional<value_type> next() {
      if (first == last) {
         return std::nullopt;
      }
      value_type res = *first;
      ++first;
      return res;
   }

   // Only forward iterators can be measured without consuming them.
   template<typename I = It,
            typename = std::enable_if_t<std::is_base_of_v<
               std::forward_iterator_tag,
               typename std::iterator_traits<I>::iterator_category>>>
   std::size_t remaining() const {
      return static_cast<std::size_t>(std::distance(first, last));
   }

private:
   It first;
   It last;
};

// Takes ownership of a container and yields its elements by move.
template<typename Container>
class ContainerSource {
   struct NotCopyable { };

   using CopySource = std::conditional_t<
      std::is_copy_constructible_v<typename Container::value_type>,
      ContainerSource, NotCopyable>;

public:
   using value_type = typename Container::value_type;

   explicit ContainerSource(Container items)
      : items(std::move(items)),
        pos(this->items.begin())
      { }

   // pos has to be rebuilt against our own copy of the container. Copyable
   // only when the elements are; std::vector claims to be copyable either way.
   ContainerSource(const CopySource &other)
      : items(other.items),
        offset(other.offset),
        pos(std::next(items.begin(), other.offset))
      { }

   ContainerSource(ContainerSource &&other)
      : items(std::move(other.items)),
        offset(other.offset),
        pos(std::next(items.begin(), other.offset))
      { }

   ContainerSource &operator=(ContainerSource other) {
      items = std::move(other.items);
      offset = other.offset;
      pos = std::next(items.begin(), offset);
      return *this;
   }

   std::optional<value_type> next() {
      if (pos == items.end()) {
         return std::nullopt;
      }
      value_type res = std::move(*pos);
      ++pos;
      ++offset;
      return res;
   }

   std::size_t remaining() const {
      return items.size() - offset;
   }

private:
   Container items;
   std::size_t offset = 0;
   typename Container::iterator pos;
};

// Calls a function for every item. The function returns std::optional<T> and
// signals the end of the sequence with std::nullopt. It may never do so.
template<typename Fn>
class GeneratorSource {
public:
   using value_type = typename std::invoke_result_t<Fn &>::value_type;

   explicit GeneratorSource(Fn fn)
      : fn(std::move(fn))
      { }

   std::optional<value_type> next() {
      return fn();
   }

private:
   Fn fn;
};

} // namespace ccm::lookahead

#endif
