#pragma once

#include <string>

namespace apiclient::ports::output {

/**
 * @brief Проверка доступности внешнего сервиса
 */
class IHealthProbe {
public:
    virtual ~IHealthProbe() = default;

    virtual std::string name() const = 0;

    /**
     * @return true если сервис отвечает; может бросать исключение
     */
    virtual bool probe() = 0;
};

} // namespace apiclient::ports::output
