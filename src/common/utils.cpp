#include "common/utils.hpp"
#include <stdlib.h>
#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <mutex>

namespace grader {
using namespace std;

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

string random_uuid() {
    // random_generator 不是线程安全的
    static mutex generator_mutex;
    static boost::uuids::random_generator generator;
    scoped_lock guard(generator_mutex);
    return boost::lexical_cast<string>(generator());
}

}  // namespace grader
