#pragma once

namespace NRelay {

/// Combines lambdas into one visitor for std::visit.
template<typename... Ts> struct TOverloaded : Ts... { using Ts::operator()...; };
template<typename... Ts> TOverloaded(Ts...) -> TOverloaded<Ts...>;

} // namespace NRelay
