#ifndef PARALLEL_H
#define PARALLEL_H

#include <exception>

// Exceptions must not cross an OpenMP region boundary. Loop bodies run
// through capture(); the first error is rethrown on the calling thread
// after the loop by rethrowIfAny().
class ParallelErrorSink {
public:
    template <typename Fn>
    void capture(Fn&& fn) noexcept {
        try {
            fn();
        } catch (...) {
            #pragma omp critical(vfe_parallel_error)
            {
                if (!error_) error_ = std::current_exception();
            }
        }
    }

    void rethrowIfAny() const {
        if (error_) std::rethrow_exception(error_);
    }

private:
    std::exception_ptr error_;
};

#endif
