#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <batchflow/batchflow.hpp>

// ---------------------------------------------------------------------------
// Pipeline inspector
// ---------------------------------------------------------------------------
// Builds a synthetic Float32 dataset named "default" with the requested
// (T, B, C, H, W) shape, assembles a feeding pipeline from the command line
// and prints the shape of every batch it yields. Useful to check that a
// combination of padding, cropping and batch size produces what the network
// expects before starting a long training run.
//
// Augmentations are applied in a fixed order: pad, crop, flip, noise.
// ---------------------------------------------------------------------------

using namespace batchflow;

namespace {

void usage() {
    std::cerr << "Usage:\n"
              << "  batchflow_inspect <T> <B> <C> <H> <W> [options]\n"
              << "Options:\n"
              << "  --iterator undivided|online|minibatches  (default minibatches)\n"
              << "  --batch-size N      sequences per minibatch\n"
              << "  --no-shuffle        keep the original sequence order\n"
              << "  --pad S             pad images by S pixels on every side\n"
              << "  --crop H W          random crop to H x W\n"
              << "  --flip P            flip horizontally with probability P\n"
              << "  --noise STD         add Gaussian noise\n"
              << "  --epochs N          number of passes (default 1)\n"
              << "  --seed S            seed for every random component\n"
              << "  --verbose           show the progress bar\n";
}

struct InspectOptions {
    Tensor::Shape shape{};
    std::string iterator{"minibatches"};
    std::size_t batch_size{BATCHFLOW_DEFAULT_BATCH_SIZE};
    bool shuffle{true};
    std::optional<std::size_t> pad{};
    std::optional<CropShape> crop{};
    std::optional<double> flip{};
    std::optional<double> noise{};
    std::size_t epochs{1};
    std::optional<RandomState::Seed> seed{};
    bool verbose{false};
};

std::size_t to_size(const char* s) { return static_cast<std::size_t>(std::stoul(s)); }

// Returns std::nullopt when the command line is malformed.
std::optional<InspectOptions> parse_args(int argc, char** argv) {
    if (argc < 6)
        return std::nullopt;
    InspectOptions opts;
    for (int i = 1; i <= 5; ++i)
        opts.shape.push_back(to_size(argv[i]));

    for (int i = 6; i < argc; ++i) {
        std::string arg = argv[i];
        auto has_value = [&](int count) { return i + count < argc; };
        if (arg == "--iterator" && has_value(1)) {
            opts.iterator = argv[++i];
        } else if (arg == "--batch-size" && has_value(1)) {
            opts.batch_size = to_size(argv[++i]);
        } else if (arg == "--no-shuffle") {
            opts.shuffle = false;
        } else if (arg == "--pad" && has_value(1)) {
            opts.pad = to_size(argv[++i]);
        } else if (arg == "--crop" && has_value(2)) {
            CropShape crop;
            crop.height = to_size(argv[++i]);
            crop.width = to_size(argv[++i]);
            opts.crop = crop;
        } else if (arg == "--flip" && has_value(1)) {
            opts.flip = std::stod(argv[++i]);
        } else if (arg == "--noise" && has_value(1)) {
            opts.noise = std::stod(argv[++i]);
        } else if (arg == "--epochs" && has_value(1)) {
            opts.epochs = to_size(argv[++i]);
        } else if (arg == "--seed" && has_value(1)) {
            opts.seed = static_cast<RandomState::Seed>(std::stoul(argv[++i]));
        } else if (arg == "--verbose") {
            opts.verbose = true;
        } else {
            return std::nullopt;
        }
    }
    return opts;
}

// Every element holds its own flat index so crops and flips stay traceable.
Tensor make_dataset(const Tensor::Shape& shape) {
    std::size_t count = numel(shape);
    std::vector<std::byte> data(count * sizeof(float));
    auto* out = reinterpret_cast<float*>(data.data());
    for (std::size_t i = 0; i < count; ++i)
        out[i] = static_cast<float>(i);
    return Tensor{Tensor::DType::Float32, shape, std::move(data)};
}

std::shared_ptr<DataIterator> build_pipeline(const InspectOptions& opts) {
    NamedTensors named{{BATCHFLOW_DEFAULT_DATA_NAME, make_dataset(opts.shape)}};

    std::shared_ptr<DataIterator> it;
    if (opts.iterator == "undivided") {
        it = make_undivided(std::move(named));
    } else if (opts.iterator == "online") {
        OnlineOptions o;
        o.shuffle = opts.shuffle;
        o.seed = opts.seed;
        it = make_online(std::move(named), o);
    } else if (opts.iterator == "minibatches") {
        MinibatchOptions o;
        o.shuffle = opts.shuffle;
        o.seed = opts.seed;
        o.batch_size = opts.batch_size;
        it = make_minibatches(std::move(named), o);
    } else {
        throw std::invalid_argument("unknown iterator " + opts.iterator);
    }

    // Each augmentation gets its own seed derived from --seed.
    RandomState seeds{opts.seed};
    auto stage_seed = [&]() -> std::optional<RandomState::Seed> {
        if (!opts.seed)
            return std::nullopt;
        return seeds.generate_seed();
    };

    const std::string name = BATCHFLOW_DEFAULT_DATA_NAME;
    if (opts.pad)
        it = make_pad(it, {{name, *opts.pad}});
    if (opts.crop)
        it = make_random_crop(it, {{name, *opts.crop}}, stage_seed());
    if (opts.flip)
        it = make_flip(it, std::map<std::string, double>{{name, *opts.flip}}, stage_seed());
    if (opts.noise)
        it = make_add_gaussian_noise(it, {{name, *opts.noise}}, std::nullopt, stage_seed());
    return it;
}

} // namespace

int main(int argc, char** argv) {
    std::optional<InspectOptions> opts;
    try {
        opts = parse_args(argc, argv);
    } catch (const std::exception&) {
        // std::stoul / std::stod reject non numeric arguments.
        opts.reset();
    }
    if (!opts) {
        usage();
        return 1;
    }

    try {
        auto pipeline = build_pipeline(*opts);
        Handler handler;
        for (std::size_t epoch = 0; epoch < opts->epochs; ++epoch) {
            auto stream = (*pipeline)(handler, opts->verbose);
            std::size_t index = 0;
            for (auto& batch : *stream) {
                std::cout << "epoch " << epoch << " batch " << index++;
                for (const auto& [name, t] : batch)
                    std::cout << ' ' << name << ' ' << dtype_name(t.dtype())
                              << shape_to_string(t.shape());
                std::cout << '\n';
            }
        }
        return 0;
    } catch (const IteratorValidationError& e) {
        std::cerr << "invalid pipeline: " << e.what() << '\n';
        return 1;
    } catch (const std::exception& e) {
        std::cerr << e.what() << '\n';
        return 1;
    }
}
