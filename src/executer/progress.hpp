#ifndef REQ_FORGE_PROGRESS_HPP
#define REQ_FORGE_PROGRESS_HPP

#include <atomic>
#include <cstddef>

namespace executer {
    // Bookkeeping for a progress display. Never used for control flow.
    class IProgress {
       public:
        IProgress() = default;
        virtual ~IProgress() = default;
        IProgress(const IProgress&) = delete;
        IProgress& operator=(const IProgress&) = delete;
        IProgress(IProgress&&) = delete;
        IProgress& operator=(IProgress&&) = delete;

        virtual void tick() = 0;
        virtual void drop(size_t remaining) = 0;
    };

    class CountingProgress : public IProgress {
       public:
        void add_total(size_t n) { total_ += n; }

        void tick() override { ++completed_; }
        void drop(size_t remaining) override { dropped_ += remaining; }

        [[nodiscard]] size_t total() const { return total_.load(); }
        [[nodiscard]] size_t completed() const { return completed_.load(); }
        [[nodiscard]] size_t dropped() const { return dropped_.load(); }

       private:
        std::atomic<size_t> total_{0};
        std::atomic<size_t> completed_{0};
        std::atomic<size_t> dropped_{0};
    };
}  // namespace executer

#endif
