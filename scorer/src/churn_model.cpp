#include "churn_model.hpp"
#include "churn_errors.hpp"
#include "log.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

// Helpers: robust stats
static double median_inplace(std::vector<double> v) {
    if (v.empty()) return 0.0;
    size_t mid = v.size()/2;
    std::nth_element(v.begin(), v.begin()+mid, v.end());
    double m = v[mid];
    if (v.size() % 2 == 0) {
        auto lower_max = *std::max_element(v.begin(), v.begin()+mid);
        m = 0.5 * (m + lower_max);
    }
    return m;
}

static double sigmoid(double z) {
    if (z >= 0) return 1.0 / (1.0 + std::exp(-z));
    double e = std::exp(z);
    return e / (1.0 + e);
}

// log(1 + e^z) without overflow
static double softplus(double z) {
    return z > 0 ? z + std::log1p(std::exp(-z)) : std::log1p(std::exp(z));
}

Model fitPreprocessing(const FeatureMatrix& X, const std::vector<std::string>& features) {
    if (static_cast<size_t>(X.cols()) != features.size()) {
        throw TrainingError("Feature matrix has " + std::to_string(X.cols()) +
                            " columns, schema has " + std::to_string(features.size()));
    }
    Model m;
    m.features = features;
    const Eigen::Index n = X.rows();
    for (Eigen::Index j = 0; j < X.cols(); ++j) {
        std::vector<double> seen;
        seen.reserve(static_cast<size_t>(n));
        for (Eigen::Index i = 0; i < n; ++i) {
            if (!std::isnan(X(i, j))) seen.push_back(X(i, j));
        }
        const double med = median_inplace(seen);

        double sum = 0.0;
        for (Eigen::Index i = 0; i < n; ++i) sum += std::isnan(X(i, j)) ? med : X(i, j);
        const double mean = n > 0 ? sum / static_cast<double>(n) : 0.0;
        double sq = 0.0;
        for (Eigen::Index i = 0; i < n; ++i) {
            double d = (std::isnan(X(i, j)) ? med : X(i, j)) - mean;
            sq += d * d;
        }
        double sd = n > 0 ? std::sqrt(sq / static_cast<double>(n)) : 0.0;
        if (sd <= 1e-12 * std::max(1.0, std::abs(mean))) sd = 0.0;

        m.median.push_back(med);
        m.mean.push_back(mean);
        m.scale.push_back(sd);
    }
    m.coef.assign(features.size(), 0.0);
    return m;
}

FeatureMatrix standardize(const Model& model, const FeatureMatrix& X) {
    if (static_cast<size_t>(X.cols()) != model.mean.size()) {
        throw std::runtime_error("Feature matrix width does not match model");
    }
    FeatureMatrix Z(X.rows(), X.cols());
    for (Eigen::Index j = 0; j < X.cols(); ++j) {
        const size_t k = static_cast<size_t>(j);
        for (Eigen::Index i = 0; i < X.rows(); ++i) {
            double v = std::isnan(X(i, j)) ? model.median[k] : X(i, j);
            Z(i, j) = model.scale[k] > 0.0 ? (v - model.mean[k]) / model.scale[k] : 0.0;
        }
    }
    return Z;
}

double probabilityPercent(double p) {
    return std::nearbyint(p * 100.0 * 100.0) / 100.0;
}

// L2-penalized, sample-weighted logistic loss on A = [Z | 1].
static double objective(const Eigen::MatrixXd& A, const Eigen::VectorXd& y,
                        const Eigen::VectorXd& s, const Eigen::VectorXd& beta, double c) {
    const Eigen::Index p = beta.size() - 1;
    Eigen::VectorXd z = A * beta;
    double loss = 0.0;
    for (Eigen::Index i = 0; i < z.size(); ++i) loss += s(i) * (softplus(z(i)) - y(i) * z(i));
    return 0.5 * beta.head(p).squaredNorm() + c * loss;
}

ScoreResult fitPredict(const FeatureMatrix& X,
                       const std::optional<std::vector<int>>& labels,
                       const FitOptions& opts,
                       const std::vector<std::string>& features) {
    ScoreResult out;
    const Eigen::Index n = X.rows();
    const size_t rows = static_cast<size_t>(n);

    if (labels && labels->size() != rows) {
        throw TrainingError("Label vector has " + std::to_string(labels->size()) +
                            " entries but feature matrix has " + std::to_string(rows) + " rows");
    }

    out.model = fitPreprocessing(X, features);
    out.standardized = standardize(out.model, X);

    if (!labels) {
        Log::write(LogLevel::Warn, "No labels supplied: model not trained, all probabilities are 0");
        out.predicted.assign(rows, 0);
        out.probability.assign(rows, 0.0);
        return out;
    }
    if (n == 0) throw TrainingError("Cannot train on an empty feature matrix");

    // --- class weights ---
    size_t pos = 0;
    for (int v : *labels) {
        if (v != 0 && v != 1) throw TrainingError("Labels must be 0 or 1, got " + std::to_string(v));
        pos += static_cast<size_t>(v);
    }
    if (pos == 0 || pos == rows) {
        throw TrainingError("Labels contain a single class (" + std::to_string(pos) +
                            " positive of " + std::to_string(rows) + ")");
    }
    const double w_pos = opts.balanced ? static_cast<double>(n) / (2.0 * static_cast<double>(pos)) : 1.0;
    const double w_neg = opts.balanced ? static_cast<double>(n) / (2.0 * static_cast<double>(rows - pos)) : 1.0;

    const Eigen::Index p = X.cols();
    Eigen::MatrixXd A(n, p + 1);
    A.leftCols(p) = out.standardized;
    A.col(p).setOnes();
    Eigen::VectorXd y(n), s(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        y(i) = (*labels)[static_cast<size_t>(i)];
        s(i) = y(i) > 0.5 ? w_pos : w_neg;
    }

    // --- Newton iterations with backtracking ---
    Eigen::VectorXd beta = Eigen::VectorXd::Zero(p + 1);
    double f = objective(A, y, s, beta, opts.c);
    int it = 0;
    bool converged = false;
    for (; it < opts.max_iter; ++it) {
        Eigen::VectorXd z = A * beta;
        Eigen::VectorXd prob(n), curv(n);
        for (Eigen::Index i = 0; i < n; ++i) {
            prob(i) = sigmoid(z(i));
            curv(i) = opts.c * s(i) * prob(i) * (1.0 - prob(i));
        }
        Eigen::VectorXd grad = opts.c * (A.transpose() * (s.cwiseProduct(prob - y)));
        grad.head(p) += beta.head(p);
        if (!grad.allFinite()) throw TrainingError("Non-finite gradient during model fit");
        if (grad.lpNorm<Eigen::Infinity>() <= opts.tol) { converged = true; break; }

        Eigen::MatrixXd H = A.transpose() * curv.asDiagonal() * A;
        H.diagonal().head(p).array() += 1.0;
        H(p, p) += 1e-10;
        Eigen::LDLT<Eigen::MatrixXd> ldlt(H);
        if (ldlt.info() != Eigen::Success) throw TrainingError("Singular Hessian during model fit");
        Eigen::VectorXd step = ldlt.solve(grad);

        const double slope = grad.dot(step);
        double t = 1.0;
        double f_new = objective(A, y, s, beta - step, opts.c);
        while (f_new > f - 1e-4 * t * slope && t > 1e-10) {
            t *= 0.5;
            f_new = objective(A, y, s, beta - t * step, opts.c);
        }
        beta -= t * step;
        f = f_new;
        if (!std::isfinite(f)) throw TrainingError("Non-finite loss during model fit");
    }

    Model& m = out.model;
    for (Eigen::Index j = 0; j < p; ++j) m.coef[static_cast<size_t>(j)] = beta(j);
    m.intercept = beta(p);
    m.trained = true;
    m.iterations = it;
    m.converged = converged;
    if (!converged) {
        Log::write(LogLevel::Warn, "Model fit hit the iteration cap (%d) before converging", opts.max_iter);
    }
    Log::write(LogLevel::Info, "Fitted logistic model on %zu rows (%zu positive) in %d iterations, intercept=%.4f",
               rows, pos, it, m.intercept);

    Eigen::VectorXd z = A * beta;
    out.probability.resize(rows);
    out.predicted.resize(rows);
    for (size_t i = 0; i < rows; ++i) {
        double pr = sigmoid(z(static_cast<Eigen::Index>(i)));
        if (!std::isfinite(pr)) throw TrainingError("Non-finite probability for row " + std::to_string(i));
        out.probability[i] = pr;
        out.predicted[i] = pr >= m.threshold ? 1 : 0;
    }
    return out;
}
