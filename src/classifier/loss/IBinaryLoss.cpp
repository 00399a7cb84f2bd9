#include "classifier/loss/IBinaryLoss.hpp"
#ifdef _OPENMP
#include <omp.h>
#endif

void IBinaryLoss::computeGradientsHessians(
    const std::vector<double>& y_true,
    const std::vector<double>& margins,
    std::vector<double>& gradients,
    std::vector<double>& hessians) const {

    const long long n = static_cast<long long>(y_true.size());
    gradients.resize(n);
    hessians.resize(n);

    #pragma omp parallel for schedule(static, 1024) if(n > 2000)
    for (long long i = 0; i < n; ++i) {
        gradients[i] = gradient(y_true[i], margins[i]);
        hessians[i] = hessian(y_true[i], margins[i]);
    }
}

double IBinaryLoss::computeBatchLoss(
    const std::vector<double>& y_true,
    const std::vector<double>& margins) const {

    const long long n = static_cast<long long>(y_true.size());
    if (n == 0) return 0.0;

    // Per-row terms in parallel, summed in row order so the recorded loss
    // is the same for every thread count.
    std::vector<double> terms(n);
    #pragma omp parallel for schedule(static, 1024) if(n > 2000)
    for (long long i = 0; i < n; ++i) {
        terms[i] = loss(y_true[i], margins[i]);
    }

    double totalLoss = 0.0;
    for (double t : terms) totalLoss += t;
    return totalLoss / n;
}
