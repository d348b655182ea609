#include "evaluator.hpp"

#include "errors.hpp"

#include <stdexcept>
#include <variant>

namespace ratcalc {

namespace {

// Обход дерева: по одному обработчику на каждый вид узла,
// пропущенный вид узла не скомпилируется
class NodeVisitor {
public:
    explicit NodeVisitor(VariableTable& variables) : variables(variables) {}

    Number visit(const Expression& expression) const {
        return std::visit(*this, expression.node);
    }

    Number operator()(const Literal& node) const {
        return node.value;
    }

    Number operator()(const Variable& node) const {
        auto value = variables.get(node.name);
        if (!value) {
            throw EvalError(EvalError::Kind::UndefinedVariable, node.name);
        }
        return *value;
    }

    Number operator()(const UnaryOp& node) const {
        Number operand = visit(*node.operand);
        switch (node.op) {
        case '+':
            return operand; // Унарный плюс ничего не меняет
        case '-':
            return -operand;
        default:
            throw std::logic_error("Неизвестная унарная операция");
        }
    }

    Number operator()(const BinaryOp& node) const {
        Number left = visit(*node.left);
        Number right = visit(*node.right);
        switch (node.op) {
        case '+':
            return left + right;
        case '-':
            return left - right;
        case '*':
            return left * right;
        case '/':
            return left / right;
        case '^':
            return left.pow(right);
        default:
            throw std::logic_error("Неизвестная бинарная операция");
        }
    }

    Number operator()(const Root& node) const {
        Number degree = visit(*node.degree);
        Number radicand = visit(*node.radicand);
        return radicand.root(degree);
    }

    // Правая часть вычисляется полностью до записи в таблицу
    Number operator()(const Assignment& node) const {
        Number value = visit(*node.value);
        variables.set(node.name, value);
        return value;
    }

private:
    VariableTable& variables;
};

} // namespace

Number Evaluator::evaluate(const Expression& expression) const {
    return NodeVisitor(variables).visit(expression);
}

} // namespace ratcalc
