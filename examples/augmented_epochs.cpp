#include <batchflow/batchflow.hpp>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace batchflow;

namespace {

// Map UInt8 images to Float32 in the range [0,1].
class FloatCast : public AugmentingIterator {
  public:
    FloatCast(std::shared_ptr<DataIterator> inner, std::string name)
        : AugmentingIterator{std::move(inner), std::nullopt}, name_{std::move(name)} {
        if (require_name(layout_, name_).dtype != Tensor::DType::UInt8)
            throw IteratorValidationError(name_ + " is not a UInt8 tensor");
        layout_.at(name_).dtype = Tensor::DType::Float32;
    }

  protected:
    void apply(NamedTensors& batch) override {
        Tensor& t = batch.at(name_);
        std::size_t elems = t.data().size();
        std::vector<std::byte> data(elems * sizeof(float));
        const auto* in = reinterpret_cast<const unsigned char*>(t.data().data());
        auto* out = reinterpret_cast<float*>(data.data());
        for (std::size_t i = 0; i < elems; ++i)
            out[i] = static_cast<float>(in[i]) / 255.0f;
        t = Tensor{Tensor::DType::Float32, t.shape(), std::move(data)};
    }

  private:
    std::string name_;
};

Tensor random_images(Tensor::Shape shape, RandomState& rnd) {
    auto pixels = rnd.random_integers(0, 255, numel(shape));
    std::vector<std::byte> data(pixels.size());
    for (std::size_t i = 0; i < pixels.size(); ++i)
        data[i] = static_cast<std::byte>(pixels[i]);
    return Tensor{Tensor::DType::UInt8, std::move(shape), std::move(data)};
}

} // namespace

int main() {
    RandomState rnd{2024};
    NamedTensors data{{"default", random_images({1, 64, 3, 28, 28}, rnd)},
                      {"labels", full(Tensor::DType::Int32, {1, 64, 1}, 0.0)}};

    MinibatchOptions opts;
    opts.batch_size = 16;
    opts.seed = rnd.generate_seed();
    auto minibatches = std::make_shared<Minibatches>(std::move(data), opts);

    std::shared_ptr<DataIterator> it = std::make_shared<FloatCast>(minibatches, "default");
    it = make_pad(it, {{"default", 4}});
    it = make_random_crop(it, {{"default", {28, 28}}}, rnd.generate_seed());
    it = make_flip(it, std::nullopt, rnd.generate_seed());
    it = make_add_gaussian_noise(it, {{"default", 0.05}}, std::nullopt, rnd.generate_seed());

    Handler handler;
    for (int epoch = 0; epoch < 3; ++epoch) {
        double sum = 0.0;
        std::size_t count = 0;
        auto stream = (*it)(handler, true);
        for (auto& batch : *stream) {
            const Tensor& images = batch.at("default");
            const auto* px = reinterpret_cast<const float*>(images.data().data());
            for (std::size_t i = 0; i < numel(images.shape()); ++i)
                sum += px[i];
            count += numel(images.shape());
        }
        std::cout << "epoch " << epoch << " mean pixel " << sum / count << '\n';
    }
    return 0;
}
