#include "ionbin/chunk.hpp"
#include "ionbin/reader.hpp"

#include <stddef.h>
#include <stdint.h>

#include <array>

extern "C" int FUZZ_INIT() {
  return 0; // Non-zero return values are reserved for future use.
}

extern "C" int FUZZ(const uint8_t* Data, size_t Size) {
  auto input = ionbin::chunk::copy(Data, Size);
  // Feed the input in two halves to exercise suspension.
  auto [head, tail] = split(input, Size / 2);
  auto chunks = std::array{std::move(head), std::move(tail)};
  auto r = ionbin::reader{ionbin::reader_options{.materialize = true}};
  if (auto events = ionbin::read_all(r, chunks)) {
    for (const auto& ev : *events) {
      static_cast<void>(ev.is_lazy());
    }
  }
  return 0; // Non-zero return values are reserved for future use.
}
