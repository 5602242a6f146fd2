#include "stockcast/ml/lstm_network.hpp"

#include "stockcast/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <random>
#include <stdexcept>

namespace stockcast::ml {

namespace {

double sigmoid(double x) {
	return 1.0 / (1.0 + std::exp(-x));
}

struct AdamState {
	Eigen::MatrixXd mW, vW;
	Eigen::VectorXd mb, vb;
	Eigen::RowVectorXd mWy, vWy;
	double mby = 0.0;
	double vby = 0.0;
};

} // namespace

LstmNetwork::LstmNetwork(int hidden_size, std::uint32_t seed) : hidden_(hidden_size), seed_(seed) {
	if (hidden_size <= 0) {
		throw std::invalid_argument("LSTM hidden size must be positive.");
	}
	std::mt19937 rng(seed_);
	const int inputs = 1 + hidden_;
	const double limit = std::sqrt(6.0 / static_cast<double>(inputs + 4 * hidden_));
	std::uniform_real_distribution<double> uniform(-limit, limit);

	W_.resize(4 * hidden_, inputs);
	for (Eigen::Index r = 0; r < W_.rows(); ++r) {
		for (Eigen::Index c = 0; c < W_.cols(); ++c) {
			W_(r, c) = uniform(rng);
		}
	}
	b_ = Eigen::VectorXd::Zero(4 * hidden_);
	b_.segment(hidden_, hidden_).setOnes(); // forget gate bias

	const double out_limit = std::sqrt(6.0 / static_cast<double>(hidden_ + 1));
	std::uniform_real_distribution<double> out_uniform(-out_limit, out_limit);
	Wy_.resize(hidden_);
	for (Eigen::Index c = 0; c < Wy_.size(); ++c) {
		Wy_[c] = out_uniform(rng);
	}
}

double LstmNetwork::forwardTrace(const std::vector<double> &window, Trace &trace) const {
	const int H = hidden_;
	trace.inputs.clear();
	trace.gates.clear();
	trace.cells.assign(1, Eigen::VectorXd::Zero(H));
	trace.hiddens.assign(1, Eigen::VectorXd::Zero(H));

	for (double x : window) {
		Eigen::VectorXd input(1 + H);
		input[0] = x;
		input.tail(H) = trace.hiddens.back();
		Eigen::VectorXd z = W_ * input + b_;
		for (int k = 0; k < H; ++k) {
			z[k] = sigmoid(z[k]);
			z[H + k] = sigmoid(z[H + k]);
			z[2 * H + k] = std::tanh(z[2 * H + k]);
			z[3 * H + k] = sigmoid(z[3 * H + k]);
		}
		const Eigen::VectorXd c = z.segment(H, H).cwiseProduct(trace.cells.back()) +
		                          z.segment(0, H).cwiseProduct(z.segment(2 * H, H));
		const Eigen::VectorXd h = z.segment(3 * H, H).cwiseProduct(c.array().tanh().matrix());
		trace.inputs.push_back(std::move(input));
		trace.gates.push_back(std::move(z));
		trace.cells.push_back(c);
		trace.hiddens.push_back(h);
	}
	return Wy_.dot(trace.hiddens.back()) + by_;
}

double LstmNetwork::forward(const std::vector<double> &window) const {
	Trace trace;
	return forwardTrace(window, trace);
}

void LstmNetwork::backward(const Trace &trace, double output_grad, Gradients &grads) const {
	const int H = hidden_;
	grads.Wy += output_grad * trace.hiddens.back().transpose();
	grads.by += output_grad;

	Eigen::VectorXd dh = output_grad * Wy_.transpose();
	Eigen::VectorXd dc = Eigen::VectorXd::Zero(H);
	for (std::size_t step = trace.gates.size(); step-- > 0;) {
		const Eigen::VectorXd &gates = trace.gates[step];
		const Eigen::VectorXd &c = trace.cells[step + 1];
		const Eigen::VectorXd &c_prev = trace.cells[step];
		const Eigen::VectorXd tanh_c = c.array().tanh().matrix();

		const auto i = gates.segment(0, H).array();
		const auto f = gates.segment(H, H).array();
		const auto g = gates.segment(2 * H, H).array();
		const auto o = gates.segment(3 * H, H).array();

		dc.array() += dh.array() * o * (1.0 - tanh_c.array().square());

		Eigen::VectorXd dz(4 * H);
		dz.segment(0, H) = (dc.array() * g * i * (1.0 - i)).matrix();
		dz.segment(H, H) = (dc.array() * c_prev.array() * f * (1.0 - f)).matrix();
		dz.segment(2 * H, H) = (dc.array() * i * (1.0 - g.square())).matrix();
		dz.segment(3 * H, H) = (dh.array() * tanh_c.array() * o * (1.0 - o)).matrix();

		grads.W += dz * trace.inputs[step].transpose();
		grads.b += dz;

		dh = W_.rightCols(H).transpose() * dz;
		dc = (dc.array() * f).matrix();
	}
}

double LstmNetwork::train(const std::vector<std::vector<double>> &windows, const std::vector<double> &targets,
                          const LstmTrainingConfig &config) {
	if (windows.empty() || windows.size() != targets.size()) {
		throw std::invalid_argument("LSTM training requires matching, non-empty windows and targets.");
	}
	if (config.epochs <= 0 || config.batch_size == 0) {
		throw std::invalid_argument("LSTM training needs positive epochs and batch size.");
	}

	std::mt19937 rng(seed_ + 1);
	std::vector<std::size_t> order(windows.size());
	std::iota(order.begin(), order.end(), 0);

	AdamState adam;
	adam.mW = Eigen::MatrixXd::Zero(W_.rows(), W_.cols());
	adam.vW = adam.mW;
	adam.mb = Eigen::VectorXd::Zero(b_.size());
	adam.vb = adam.mb;
	adam.mWy = Eigen::RowVectorXd::Zero(Wy_.size());
	adam.vWy = adam.mWy;

	Trace trace;
	double epoch_loss = 0.0;
	long step = 0;
	for (int epoch = 0; epoch < config.epochs; ++epoch) {
		std::shuffle(order.begin(), order.end(), rng);
		epoch_loss = 0.0;

		for (std::size_t start = 0; start < order.size(); start += config.batch_size) {
			const std::size_t end = std::min(order.size(), start + config.batch_size);
			const double batch = static_cast<double>(end - start);

			Gradients grads{Eigen::MatrixXd::Zero(W_.rows(), W_.cols()), Eigen::VectorXd::Zero(b_.size()),
			                Eigen::RowVectorXd::Zero(Wy_.size()), 0.0};
			for (std::size_t k = start; k < end; ++k) {
				const std::size_t idx = order[k];
				const double error = forwardTrace(windows[idx], trace) - targets[idx];
				epoch_loss += error * error;
				backward(trace, error / batch, grads);
			}

			const double norm = std::sqrt(grads.W.squaredNorm() + grads.b.squaredNorm() +
			                              grads.Wy.squaredNorm() + grads.by * grads.by);
			if (!std::isfinite(norm)) {
				throw std::runtime_error("LSTM gradients are not finite.");
			}
			if (norm > config.clip_norm) {
				const double scale = config.clip_norm / norm;
				grads.W *= scale;
				grads.b *= scale;
				grads.Wy *= scale;
				grads.by *= scale;
			}

			++step;
			const double c1 = 1.0 - std::pow(config.beta1, static_cast<double>(step));
			const double c2 = 1.0 - std::pow(config.beta2, static_cast<double>(step));
			const double lr = config.learning_rate;
			const double b1 = config.beta1;
			const double b2 = config.beta2;
			const double eps = config.epsilon;

			adam.mW = b1 * adam.mW + (1.0 - b1) * grads.W;
			adam.vW = b2 * adam.vW + (1.0 - b2) * grads.W.cwiseProduct(grads.W);
			W_.array() -= lr * (adam.mW.array() / c1) / ((adam.vW.array() / c2).sqrt() + eps);

			adam.mb = b1 * adam.mb + (1.0 - b1) * grads.b;
			adam.vb = b2 * adam.vb + (1.0 - b2) * grads.b.cwiseProduct(grads.b);
			b_.array() -= lr * (adam.mb.array() / c1) / ((adam.vb.array() / c2).sqrt() + eps);

			adam.mWy = b1 * adam.mWy + (1.0 - b1) * grads.Wy;
			adam.vWy = b2 * adam.vWy + (1.0 - b2) * grads.Wy.cwiseProduct(grads.Wy);
			Wy_.array() -= lr * (adam.mWy.array() / c1) / ((adam.vWy.array() / c2).sqrt() + eps);

			adam.mby = b1 * adam.mby + (1.0 - b1) * grads.by;
			adam.vby = b2 * adam.vby + (1.0 - b2) * grads.by * grads.by;
			by_ -= lr * (adam.mby / c1) / (std::sqrt(adam.vby / c2) + eps);
		}

		epoch_loss /= static_cast<double>(windows.size());
		if (!std::isfinite(epoch_loss)) {
			throw std::runtime_error("LSTM training diverged.");
		}
		STOCKCAST_TRACE("LSTM epoch {} loss {:.6f}", epoch + 1, epoch_loss);
	}
	return epoch_loss;
}

} // namespace stockcast::ml
