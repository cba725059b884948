#pragma once

namespace auditchain::core {
  // Visitor built from lambdas, one per variant alternative.
  template <class... Ts>
  struct overloaded : Ts... {
    using Ts::operator()...;
  };

  template <class... Ts>
  overloaded(Ts...) -> overloaded<Ts...>;
}
