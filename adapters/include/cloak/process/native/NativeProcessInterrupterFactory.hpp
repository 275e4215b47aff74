#ifndef INCLUDE_CLOAK_PROCESS_NATIVE_NATIVEPROCESSINTERRUPTERFACTORY_HPP
#define INCLUDE_CLOAK_PROCESS_NATIVE_NATIVEPROCESSINTERRUPTERFACTORY_HPP

#include "cloak/process/IProcessInterrupter.hpp"
#include <memory>

namespace cloak::process::native
{

// Exit status used where the platform has no interrupt mechanism.
constexpr int g_interruptFallbackExitStatus{ 1 };

[[nodiscard]] std::unique_ptr<cloak::process::IProcessInterrupter> makeNativeProcessInterrupter();

} // namespace cloak::process::native

#endif // INCLUDE_CLOAK_PROCESS_NATIVE_NATIVEPROCESSINTERRUPTERFACTORY_HPP
