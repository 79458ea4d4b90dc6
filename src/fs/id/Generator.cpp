#include "fs/id/Generator.hpp"

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

using namespace tfs::fs::id;

namespace {
// Namespace for name-based identifiers derived from request keys.
const boost::uuids::uuid REQUEST_NAMESPACE = boost::uuids::string_generator()("6f1d2c64-8e0a-4b7f-9a53-2f0c7e5d1b48");
}

std::string Generator::next() {
    if (!requestKey_) return random();
    boost::uuids::name_generator_sha1 gen(REQUEST_NAMESPACE);
    return boost::uuids::to_string(gen(*requestKey_ + "#" + std::to_string(sequence_++)));
}

std::string Generator::random() {
    thread_local boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}
