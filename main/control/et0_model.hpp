#ifndef ET0_MODEL_HPP
#define ET0_MODEL_HPP

#include <cmath>
#include <cstddef>
#include <main/models/error_code.hpp>
#include <main/models/weather_sample.hpp>

namespace Et0 {
    // One dense layer. `weights` is laid out [input][neuron] (row = input),
    // so each neuron's weight vector is the column `neuron` across every row.
    template<std::size_t In, std::size_t N>
    void denseForward(const double (&input)[In],
                      const double (&weights)[In * N],
                      const double (&biases)[N],
                      bool relu,
                      double (&output)[N]) {
        for (std::size_t neuron = 0; neuron < N; ++neuron) {
            double activation = 0.0;
            for (std::size_t i = 0; i < In; ++i) {
                activation += input[i] * weights[i * N + neuron];
            }
            activation += biases[neuron];
            if (relu && activation < 0.0) {
                activation = 0.0;
            }
            output[neuron] = activation;
        }
    }

    // Standardize -> dense+ReLU -> dense+ReLU -> dense+identity.
    // Holds references to build-time tables; sizes are checked by the compiler.
    template<std::size_t In, std::size_t H1, std::size_t H2, std::size_t Out>
    class MlpRegressor {
    public:
        static_assert(In > 0 && H1 > 0 && H2 > 0 && Out > 0, "MLP layers must be non-empty");

        MlpRegressor(const double (&mean)[In], const double (&scale)[In],
                     const double (&w0)[In * H1], const double (&b0)[H1],
                     const double (&w1)[H1 * H2], const double (&b1)[H2],
                     const double (&w2)[H2 * Out], const double (&b2)[Out])
            : mean_(mean), scale_(scale), w0_(w0), b0_(b0), w1_(w1), b1_(b1), w2_(w2), b2_(b2) {}

        std::size_t inputWidth() const { return In; }

        // Raw network output for the first output neuron. No clamping here;
        // callers enforce physical limits.
        ErrorCode predict(const double* features, std::size_t count, double& out_value) const {
            if (features == nullptr || count != In) {
                return ErrorCode::FEATURE_LENGTH_MISMATCH;
            }
            double scaled[In];
            for (std::size_t i = 0; i < In; ++i) {
                scaled[i] = (scale_[i] == 0.0) ? 0.0 : (features[i] - mean_[i]) / scale_[i];
            }
            double hidden1[H1];
            double hidden2[H2];
            double output[Out];
            denseForward<In, H1>(scaled, w0_, b0_, true, hidden1);
            denseForward<H1, H2>(hidden1, w1_, b1_, true, hidden2);
            denseForward<H2, Out>(hidden2, w2_, b2_, false, output);
            if (!std::isfinite(output[0])) {
                return ErrorCode::INFERENCE_FAILED;
            }
            out_value = output[0];
            return ErrorCode::OK;
        }

    private:
        const double (&mean_)[In];
        const double (&scale_)[In];
        const double (&w0_)[In * H1];
        const double (&b0_)[H1];
        const double (&w1_)[H1 * H2];
        const double (&b1_)[H2];
        const double (&w2_)[H2 * Out];
        const double (&b2_)[Out];
    };

    // Trained on [T2M_MAX, RH2M, ALLSKY_SFC_SW_DWN]
    using Et0Network = MlpRegressor<3, 16, 8, 1>;

    const Et0Network& model();

    // Convenience wrapper feeding a weather sample in training order
    ErrorCode predict(const WeatherSample& sample, double& out_et0);
}

#endif // ET0_MODEL_HPP
