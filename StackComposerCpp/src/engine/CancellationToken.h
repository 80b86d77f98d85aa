#ifndef CANCELLATION_TOKEN_H
#define CANCELLATION_TOKEN_H

#include <algorithm>
#include <atomic>
#include <memory>

namespace StackComposer
{

    // 控制线程置位，导出线程在帧与帧之间检查
    class CancellationToken
    {
    public:
        CancellationToken()
            : m_flag(std::make_shared<std::atomic<bool>>(false))
        {
        }

        void cancel() { m_flag->store(true); }
        bool isCancelled() const { return m_flag->load(); }
        void reset() { m_flag->store(false); }

    private:
        std::shared_ptr<std::atomic<bool>> m_flag;
    };

    // 导出进度，单调不减，范围 [0, 1]
    class ExportProgress
    {
    public:
        void update(double value)
        {
            value = std::min(std::max(value, 0.0), 1.0);
            double current = m_value.load();
            while (value > current && !m_value.compare_exchange_weak(current, value))
            {
            }
        }

        double value() const { return m_value.load(); }
        void reset() { m_value.store(0.0); }

    private:
        std::atomic<double> m_value{0.0};
    };

} // namespace StackComposer

#endif // CANCELLATION_TOKEN_H
