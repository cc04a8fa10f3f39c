// pg_sema/linker/execution_queue.hpp - Dependency-first iteration order
#pragma once

#include <cstddef>
#include <functional>
#include <unordered_set>
#include <utility>
#include <vector>

namespace pg_sema
{

/**
 * Append-only queue that yields its items dependencies-first.
 *
 * Traversal is an explicit-stack depth-first walk: every item reachable from
 * the queue is yielded exactly once, after all of its dependencies. Items
 * with no dependency relation keep queue order. Back-edges are detected with
 * an in-progress set separate from the done set; members of a cycle are
 * reported and never yielded.
 *
 * @tparam T    Item handle (cheap to copy, hashable), e.g. `SchemaObject *`
 * @tparam Hash Hash functor for T
 */
template <typename T, typename Hash = std::hash<T>>
class ExecutionQueue
{
public:
  using DependencyFn = std::function<const std::vector<T> &(const T &)>;

  struct Traversal
  {
    std::vector<T> order;                ///< dependencies-first, cycle members excluded
    std::vector<std::vector<T>> cycles;  ///< each cycle in discovery order
  };

  explicit ExecutionQueue(DependencyFn dependencies) : dependencies_(std::move(dependencies)) {}

  /**
   * Append `item`.
   *
   * @return false if it was already queued (the queue is unchanged)
   */
  bool add(T item)
  {
    if (!members_.insert(item).second) return false;
    items_.push_back(std::move(item));
    return true;
  }

  [[nodiscard]] bool contains(const T & item) const { return members_.count(item) > 0; }
  [[nodiscard]] size_t size() const noexcept { return items_.size(); }
  [[nodiscard]] const std::vector<T> & items() const noexcept { return items_; }

  /// Walk the queue. Repeated calls give the same result.
  [[nodiscard]] Traversal traverse() const
  {
    Traversal out;
    std::unordered_set<T, Hash> done;
    std::unordered_set<T, Hash> in_progress;
    std::unordered_set<T, Hash> cyclic;

    struct Frame
    {
      T item;
      size_t next_child;
    };
    std::vector<Frame> stack;

    for (const T & root : items_) {
      if (done.count(root) > 0) continue;

      stack.push_back(Frame{root, 0});
      in_progress.insert(root);

      while (!stack.empty()) {
        Frame & top = stack.back();
        const std::vector<T> & deps = dependencies_(top.item);

        if (top.next_child < deps.size()) {
          const T child = deps[top.next_child++];
          if (done.count(child) > 0) continue;

          if (in_progress.count(child) > 0) {
            // Back-edge: the stack from `child` to the top is a cycle.
            std::vector<T> cycle;
            bool inside = false;
            for (const Frame & f : stack) {
              if (f.item == child) inside = true;
              if (inside) cycle.push_back(f.item);
            }
            for (const T & member : cycle) cyclic.insert(member);
            out.cycles.push_back(std::move(cycle));
            continue;
          }

          stack.push_back(Frame{child, 0});
          in_progress.insert(child);
          continue;
        }

        const T finished = top.item;
        stack.pop_back();
        in_progress.erase(finished);
        done.insert(finished);
        if (cyclic.count(finished) == 0) {
          out.order.push_back(finished);
        }
      }
    }

    return out;
  }

private:
  DependencyFn dependencies_;
  std::vector<T> items_;
  std::unordered_set<T, Hash> members_;
};

}  // namespace pg_sema
