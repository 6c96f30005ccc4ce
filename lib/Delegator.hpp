#pragma once

namespace hr {

/**
 * Holds a non-owning pointer to a delegate that receives callbacks from
 * the owning component. The delegate must outlive the Delegator, typical
 * wiring is component.setDelegate(this) from the owner.
 */
class Delegator {
public:
  struct Delegate {
    virtual ~Delegate() = default;
  };

  void setDelegate(Delegate *delegate) { pDelegate_ = delegate; }

protected:
  // Delegate downcast to the interface a component expects, or nullptr
  template <typename T> T *getDelegate() const {
    return pDelegate_ ? dynamic_cast<T *>(pDelegate_) : nullptr;
  }

  bool hasDelegate() const { return pDelegate_ != nullptr; }

private:
  Delegate *pDelegate_{ nullptr };
};

} // namespace hr
