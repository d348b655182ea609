#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace ratcalc {

// Базовый класс для всех ошибок обработки выражения (лексер, парсер, вычислитель).
// Фронтенд ловит именно его, показывает сообщение и продолжает работу.
class EngineError : public std::runtime_error {
public:
    EngineError(const std::string& message, std::size_t position)
        : std::runtime_error(message), position(position) {}

    // Позиция (в байтах) во входной строке, к которой относится ошибка
    std::size_t where() const { return position; }

private:
    std::size_t position;
};

// Ошибка лексического анализа
class LexError final : public EngineError {
public:
    enum class Kind {
        UnrecognizedCharacter
    };

    LexError(Kind kind, std::size_t position);

    Kind kind() const { return errorKind; }

private:
    Kind errorKind;
};

// Ошибка синтаксического анализа
class ParseError final : public EngineError {
public:
    enum class Kind {
        UnmatchedParen,
        TrailingInput,
        EmptyExpression,
        UnexpectedToken,
        ArgumentCount,  // Неверное число аргументов встроенной функции
        NestingTooDeep  // Превышена глубина вложенности выражения
    };

    ParseError(Kind kind, std::size_t position);

    Kind kind() const { return errorKind; }

private:
    Kind errorKind;
};

// Ошибка вычисления
class EvalError final : public EngineError {
public:
    enum class Kind {
        DivisionByZero,
        InvalidExponent,
        ComplexResult,
        UndefinedVariable,
        InvalidName,
        ReservedName
    };

    explicit EvalError(Kind kind, std::string name = {});

    Kind kind() const { return errorKind; }

    // Имя переменной для UndefinedVariable / InvalidName / ReservedName
    const std::string& name() const { return subject; }

private:
    Kind errorKind;
    std::string subject;
};

// Ошибка чтения файла истории. Не фатальна: вызывающий подставляет пустую историю.
class LoadError final : public std::runtime_error {
public:
    enum class Kind {
        Corrupt,
        IncompatibleVersion,
        Io
    };

    LoadError(Kind kind, const std::string& detail);

    Kind kind() const { return errorKind; }

private:
    Kind errorKind;
};

// Ошибка записи файла истории. Состояние в памяти при этом сохраняется.
class SaveError final : public std::runtime_error {
public:
    enum class Kind {
        Io
    };

    SaveError(Kind kind, const std::string& detail);

    Kind kind() const { return errorKind; }

private:
    Kind errorKind;
};

} // namespace ratcalc
