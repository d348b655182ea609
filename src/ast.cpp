#include "ast.hpp"

#include <algorithm>
#include <type_traits>
#include <utility>

namespace ratcalc {

namespace {
std::size_t heightAbove(const std::unique_ptr<Expression>& child) {
    return child->height + 1;
}

std::size_t heightAbove(const std::unique_ptr<Expression>& left, const std::unique_ptr<Expression>& right) {
    return std::max(left->height, right->height) + 1;
}
}

std::unique_ptr<Expression> makeLiteral(Number value) {
    return std::make_unique<Expression>(Expression{Literal{std::move(value)}, 1});
}

std::unique_ptr<Expression> makeVariable(std::string name) {
    return std::make_unique<Expression>(Expression{Variable{std::move(name)}, 1});
}

std::unique_ptr<Expression> makeUnary(char op, std::unique_ptr<Expression> operand) {
    std::size_t height = heightAbove(operand);
    return std::make_unique<Expression>(Expression{UnaryOp{op, std::move(operand)}, height});
}

std::unique_ptr<Expression> makeBinary(char op, std::unique_ptr<Expression> left,
                                       std::unique_ptr<Expression> right) {
    std::size_t height = heightAbove(left, right);
    return std::make_unique<Expression>(
        Expression{BinaryOp{op, std::move(left), std::move(right)}, height});
}

std::unique_ptr<Expression> makeRoot(std::unique_ptr<Expression> degree,
                                     std::unique_ptr<Expression> radicand) {
    std::size_t height = heightAbove(degree, radicand);
    return std::make_unique<Expression>(Expression{Root{std::move(degree), std::move(radicand)}, height});
}

std::unique_ptr<Expression> makeAssignment(std::string name, std::unique_ptr<Expression> value) {
    std::size_t height = heightAbove(value);
    return std::make_unique<Expression>(Expression{Assignment{std::move(name), std::move(value)}, height});
}

std::string toString(const Expression& expression) {
    return std::visit(
        [](const auto& node) -> std::string {
            using Node = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<Node, Literal>) {
                return node.value.toFractionString();
            } else if constexpr (std::is_same_v<Node, Variable>) {
                return node.name;
            } else if constexpr (std::is_same_v<Node, UnaryOp>) {
                return std::string("(") + node.op + " " + toString(*node.operand) + ")";
            } else if constexpr (std::is_same_v<Node, BinaryOp>) {
                return std::string("(") + node.op + " " + toString(*node.left) + " " +
                       toString(*node.right) + ")";
            } else if constexpr (std::is_same_v<Node, Root>) {
                return "(root " + toString(*node.degree) + " " + toString(*node.radicand) + ")";
            } else {
                static_assert(std::is_same_v<Node, Assignment>, "необработанный вид узла");
                return "(= " + node.name + " " + toString(*node.value) + ")";
            }
        },
        expression.node);
}

} // namespace ratcalc
