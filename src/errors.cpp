#include "errors.hpp"

#include <utility>

namespace ratcalc {

namespace {

std::string describe(LexError::Kind kind, std::size_t position) {
    switch (kind) {
    case LexError::Kind::UnrecognizedCharacter:
        return "Недопустимый символ в позиции " + std::to_string(position);
    }
    return "Ошибка лексического анализа";
}

std::string describe(ParseError::Kind kind, std::size_t position) {
    switch (kind) {
    case ParseError::Kind::UnmatchedParen:
        return "Непарная скобка возле позиции " + std::to_string(position);
    case ParseError::Kind::TrailingInput:
        return "Неожиданный хвост выражения возле позиции " + std::to_string(position);
    case ParseError::Kind::EmptyExpression:
        return "Пустое выражение";
    case ParseError::Kind::UnexpectedToken:
        return "Неожиданный токен возле позиции " + std::to_string(position);
    case ParseError::Kind::ArgumentCount:
        return "Неверное число аргументов функции в позиции " + std::to_string(position);
    case ParseError::Kind::NestingTooDeep:
        return "Слишком глубокая вложенность выражения возле позиции " + std::to_string(position);
    }
    return "Синтаксическая ошибка";
}

std::string describe(EvalError::Kind kind, const std::string& name) {
    switch (kind) {
    case EvalError::Kind::DivisionByZero:
        return "Деление на ноль";
    case EvalError::Kind::InvalidExponent:
        return "Показатель степени или корня не даёт точного результата";
    case EvalError::Kind::ComplexResult:
        return "Корень чётной степени из отрицательного числа не поддерживается";
    case EvalError::Kind::UndefinedVariable:
        return "Неизвестная переменная '" + name + "'";
    case EvalError::Kind::InvalidName:
        return "Недопустимое имя переменной '" + name + "'";
    case EvalError::Kind::ReservedName:
        return "Имя '" + name + "' зарезервировано";
    }
    return "Ошибка вычисления";
}

std::string describe(LoadError::Kind kind, const std::string& detail) {
    switch (kind) {
    case LoadError::Kind::Corrupt:
        return "Файл истории повреждён: " + detail;
    case LoadError::Kind::IncompatibleVersion:
        return "Несовместимая версия файла истории: " + detail;
    case LoadError::Kind::Io:
        return "Не удалось прочитать файл истории: " + detail;
    }
    return detail;
}

} // namespace

LexError::LexError(Kind kind, std::size_t position)
    : EngineError(describe(kind, position), position), errorKind(kind) {}

ParseError::ParseError(Kind kind, std::size_t position)
    : EngineError(describe(kind, position), position), errorKind(kind) {}

EvalError::EvalError(Kind kind, std::string name)
    : EngineError(describe(kind, name), 0), errorKind(kind), subject(std::move(name)) {}

LoadError::LoadError(Kind kind, const std::string& detail)
    : std::runtime_error(describe(kind, detail)), errorKind(kind) {}

SaveError::SaveError(Kind kind, const std::string& detail)
    : std::runtime_error("Не удалось сохранить историю: " + detail), errorKind(kind) {}

} // namespace ratcalc
