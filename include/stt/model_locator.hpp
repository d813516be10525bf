#ifndef MODEL_LOCATOR_HPP
#define MODEL_LOCATOR_HPP

#include <stdexcept>
#include <string>
#include <vector>

class ModelNotFoundError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ".", "./models", "./models/whisper", then per-user and system-wide locations
std::vector<std::string> default_model_dirs();

// First "ggml-<variant>*.bin" found, directories in order, names sorted
// within a directory. Throws ModelNotFoundError listing what was searched.
std::string find_model(const std::string& variant, const std::vector<std::string>& dirs);

#endif
