#pragma once

/// @brief Joins a set of lambdas into one callable, so std::visit can pick the overload by type.
/// @code
///   std::visit(LambdaVisitor{[](const int &) {}, [](const auto &) {}}, variant);
/// @endcode
template <typename... taLambdas>
struct LambdaVisitor : taLambdas...
{
    using taLambdas::operator()...;
};

template <typename... taLambdas>
LambdaVisitor(taLambdas...) -> LambdaVisitor<taLambdas...>;
