#pragma once

#include <string>
#include <vector>

#include "token.hpp"

namespace ratcalc {

// Класс лексического анализатора (лексера)
// Преобразует входную строку в последовательность токенов по одному за вызов.
// Игнорирует пробельные символы. Значения литералов не вычисляет,
// только находит их границы.
class Tokenizer {
public:
    // Конструктор принимает исходную строку выражения
    explicit Tokenizer(std::string sourceText);

    // Возвращает следующий токен. После конца строки всегда возвращает End.
    // Выбрасывает LexError при обнаружении неизвестного символа
    Token next();

    // Возвращает чтение в начало строки
    void reset();

    // Считывает все токены с начала строки, последний токен всегда End
    std::vector<Token> tokenize();

private:
    const std::string source; // Исходная строка
    std::size_t index = 0;    // Текущая позиция чтения

    // Проверка достижения конца строки
    bool isAtEnd() const;

    // Возвращает текущий символ без продвижения вперед
    char peek() const;

    // Возвращает текущий символ и сдвигает указатель вперед
    char advance();

    // Пропускает пробелы, табуляции и переводы строк
    void skipWhitespace();

    // Односимвольный токен в текущей позиции
    Token makeSingle(TokenType type);

    // Считывает число (целое или десятичная дробь)
    Token makeNumber();

    // Считывает идентификатор (имя переменной или функции)
    Token makeIdentifier();
};

} // namespace ratcalc
