#pragma once

#include <stdexcept>

/**
 * @brief Повторный вызов close() на уже закрытом кэше
 *
 * Единственная ошибка, о которой кэш сообщает явно. Остальные операции
 * на закрытом кэше молча деградируют: запись игнорируется,
 * чтение ведёт себя как на пустом кэше.
 */
class AlreadyClosedError : public std::logic_error {
public:
    AlreadyClosedError()
        : std::logic_error("cache: already closed")
    {}
};
