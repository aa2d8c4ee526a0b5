#pragma once
// Value produced by a deferred action. Readable only after the action ran.

#include <memory>
#include <optional>
#include <utility>

#include "lazy/errors.hpp"

namespace lazy::elab {

template <typename T>
class ModuleValue {
  public:
    ModuleValue()
        : mResult(std::make_shared<std::optional<T>>()) {}

    bool ready() const { return mResult->has_value(); }

    const T& get() const {
        if (!ready()) {
            throw PrematureAccessError(
              "in-module value requested before its module was instantiated");
        }
        return **mResult;
    }

    // Called by the deferred action.
    void set(T value) const { *mResult = std::move(value); }

  private:
    std::shared_ptr<std::optional<T>> mResult;
};

template <>
class ModuleValue<void> {
  public:
    ModuleValue()
        : mDone(std::make_shared<bool>(false)) {}

    bool ready() const { return *mDone; }

    void get() const {
        if (!ready()) {
            throw PrematureAccessError(
              "in-module body requested before its module was instantiated");
        }
    }

    void set() const { *mDone = true; }

  private:
    std::shared_ptr<bool> mDone;
};

} // namespace lazy::elab
