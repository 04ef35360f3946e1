// ==============================================================================
// dds/cancellation.hpp - Кооперативная отмена
// ==============================================================================
//
// CancellationToken - копируемый дескриптор общего флага отмены.
// Копии ссылаются на одно состояние (shared_ptr), поэтому токен безопасно
// передавать в задачу, которая может пережить своего владельца (задача,
// брошенная по таймауту).
//
// child() создаёт токен со своим флагом, который также видит отмену
// родителя: таймаут отменяет одну задачу, сигнал - все.
//
// cancel() можно вызывать из обработчика сигнала: это одна запись в
// lock-free std::atomic<bool>.
//
// ==============================================================================

#ifndef DDS_CANCELLATION_HPP
#define DDS_CANCELLATION_HPP

#include <atomic>
#include <memory>

namespace dds {

class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    /// Запросить отмену (идемпотентно)
    void cancel() const noexcept { flag_->store(true, std::memory_order_release); }

    /// Отменён ли этот токен или любой из его предков
    bool is_cancelled() const noexcept {
        if (flag_->load(std::memory_order_acquire)) {
            return true;
        }
        return parent_ && parent_->is_cancelled();
    }

    /// Дочерний токен: отменяется сам по себе или вместе с родителем
    CancellationToken child() const {
        CancellationToken c;
        c.parent_ = std::make_shared<CancellationToken>(*this);
        return c;
    }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
    std::shared_ptr<CancellationToken> parent_;
};

}  // namespace dds

#endif  // DDS_CANCELLATION_HPP
