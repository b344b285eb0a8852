#include "emitcore/telemetry/span_handle.h"

#include <cxxabi.h>

#include <cstdlib>
#include <memory>
#include <new>
#include <string>
#include <typeinfo>

namespace emitcore::telemetry {

namespace {

class NoopSpanHandle final : public SpanHandle {
 public:
  void SetAttribute(std::string_view, const AttributeValue&) noexcept override {}
  void SetAttributes(const OptionalAttributes&) noexcept override {}
  void SetStatus(SpanStatusCode, std::string_view) noexcept override {}
  void RecordException(std::string_view, std::string_view) noexcept override {}
  void End() noexcept override {}
};

// "St13runtime_error" -> "std::runtime_error"
std::string DemangleTypeName(const char* name) {
  int status = 0;
  std::unique_ptr<char, decltype(&std::free)> demangled(
      abi::__cxa_demangle(name, nullptr, nullptr, &status), &std::free);
  if (status == 0 && demangled) {
    return demangled.get();
  }
  return name;
}

}  // namespace

std::shared_ptr<SpanHandle> NoopSpan() {
  static const std::shared_ptr<SpanHandle> span = std::make_shared<NoopSpanHandle>();
  return span;
}

void SpanHandle::RecordException(const std::exception& error) noexcept {
  const char* mangled = typeid(error).name();
  try {
    RecordException(DemangleTypeName(mangled), error.what());
  } catch (const std::bad_alloc&) {
    RecordException(mangled, error.what());
  }
}

void SpanHandle::RecordException(std::exception_ptr error) noexcept {
  if (!error) {
    return;
  }
  try {
    std::rethrow_exception(error);
  } catch (const std::exception& ex) {
    RecordException(ex);
  } catch (...) {
    RecordException("unknown", "non-standard exception");
  }
}

}  // namespace emitcore::telemetry
