#include "ojudge/problem_store.hpp"
#include <glog/logging.h>
#include "ojudge/common/io_utils.hpp"

namespace ojudge {
using namespace std;
namespace fs = std::filesystem;

directory_problem_store::directory_problem_store(const fs::path &root)
    : root(root) {}

static optional<corpus> read_corpus(const fs::path &input_file, const fs::path &output_file) {
    if (!fs::is_regular_file(input_file) || !fs::is_regular_file(output_file)) {
        VLOG(1) << "No test data at " << input_file << " and " << output_file;
        return {};
    }
    return corpus{read_file_content(input_file), read_file_content(output_file)};
}

optional<corpus> directory_problem_store::visible_corpus(const string &problem_id) const {
    fs::path dir = root / "problems" / assert_safe_path(problem_id);
    return read_corpus(dir / "input.txt", dir / "output.txt");
}

optional<corpus> directory_problem_store::hidden_corpus(const string &problem_id) const {
    string name = assert_safe_path(problem_id) + ".txt";
    return read_corpus(root / "inputs" / name, root / "outputs" / name);
}

}  // namespace ojudge
