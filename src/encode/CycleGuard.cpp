//===----------------------------------------------------------------------===//
//
// Part of the litexport project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the cycle guard.  Entries are compared by deep equality rather
// than identity, so the guard also fires for a deep-equal value that
// re-appears below an ancestor still being rendered.  Sibling values are
// never on the stack together and never trip it.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Recursion guard around the dispatcher.

#include "encode/CycleGuard.hpp"

#include <stdexcept>

namespace litexport::encode
{
namespace
{

/// @brief Pops the guard stack when the render of one value ends.
class StackFrame
{
  public:
    StackFrame(std::vector<const core::Value *> &stack, const core::Value &v) : stack_(stack)
    {
        stack_.push_back(&v);
    }

    ~StackFrame()
    {
        stack_.pop_back();
    }

    StackFrame(const StackFrame &) = delete;
    StackFrame &operator=(const StackFrame &) = delete;

  private:
    std::vector<const core::Value *> &stack_;
};

} // namespace

CycleGuard::CycleGuard(std::unique_ptr<Encoder> next, support::TraceSink trace)
    : next_(std::move(next)), trace_(trace)
{
    if (!next_)
        throw std::invalid_argument("CycleGuard: null encoder");
}

std::string_view CycleGuard::name() const
{
    return "guard";
}

bool CycleGuard::supports(const core::Value &v) const
{
    return next_->supports(v);
}

support::Expected<std::string> CycleGuard::render(const core::Value &v)
{
    for (const core::Value *active : stack_)
    {
        if (core::deepEqual(*active, v))
        {
            trace_.onLoop(stack_.size() + 1, v);
            return support::makeError(support::ErrorKind::InfiniteLoop,
                                      "unexpected infinite loop");
        }
    }

    StackFrame frame(stack_, v);
    trace_.onEnter(stack_.size(), v);
    return next_->render(v);
}

std::size_t CycleGuard::depth() const
{
    return stack_.size();
}

} // namespace litexport::encode
