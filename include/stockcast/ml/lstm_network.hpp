#pragma once

#include <Eigen/Dense>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace stockcast::ml {

struct LstmTrainingConfig {
	int epochs = 20;
	std::size_t batch_size = 32;
	double learning_rate = 0.01;
	double beta1 = 0.9;
	double beta2 = 0.999;
	double epsilon = 1e-8;
	/// Global gradient norm clip.
	double clip_norm = 5.0;
};

/**
 * @class LstmNetwork
 * @brief Single-layer LSTM over a scalar sequence with a linear read-out of the last hidden state.
 *
 * Trained on mean squared error by full backpropagation through time and
 * Adam updates. Weights are initialised from a seeded generator, so training
 * is reproducible.
 */
class LstmNetwork {
public:
	LstmNetwork(int hidden_size, std::uint32_t seed);

	/// Output for one input window.
	double forward(const std::vector<double> &window) const;

	/**
	 * @brief Fits the network to (window, target) pairs.
	 * @return Mean squared error of the last epoch.
	 */
	double train(const std::vector<std::vector<double>> &windows, const std::vector<double> &targets,
	             const LstmTrainingConfig &config);

	int hiddenSize() const {
		return hidden_;
	}

private:
	struct Gradients {
		Eigen::MatrixXd W;
		Eigen::VectorXd b;
		Eigen::RowVectorXd Wy;
		double by = 0.0;
	};

	struct Trace {
		std::vector<Eigen::VectorXd> inputs;  // [x_t; h_{t-1}]
		std::vector<Eigen::VectorXd> gates;   // [i; f; g; o] after activation
		std::vector<Eigen::VectorXd> cells;   // c_t, with c_0 first
		std::vector<Eigen::VectorXd> hiddens; // h_t, with h_0 first
	};

	double forwardTrace(const std::vector<double> &window, Trace &trace) const;
	void backward(const Trace &trace, double output_grad, Gradients &grads) const;

	int hidden_;
	Eigen::MatrixXd W_;      // 4H x (1 + H)
	Eigen::VectorXd b_;      // 4H
	Eigen::RowVectorXd Wy_;  // 1 x H
	double by_ = 0.0;
	std::uint32_t seed_;
};

} // namespace stockcast::ml
