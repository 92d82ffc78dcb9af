#include "stringio.hpp"

#include <cctype>
#include <sstream>
#include <stdexcept>

using namespace std;

namespace stringio {

vector<string> &split(const string &s, char delim, vector<string> &elems) {
    stringstream ss(s);
    string item;
    while (std::getline(ss, item, delim)) {
        elems.push_back(item);
    }
    return elems;
}

vector<string> split(const string &s, char delim) {
    vector<string> elems;
    split(s, delim, elems);
    return elems;
}

double strToDub(const string &s) {
    size_t pos = 0;
    double val = stod(s, &pos);
    // trailing whitespace is fine, anything else is not
    while (pos < s.size() && isspace(static_cast<unsigned char>(s[pos]))) {
        pos++;
    }
    if (pos != s.size()) {
        throw invalid_argument("strToDub: not a number: '" + s + "'");
    }
    return val;
}

} /* namespace stringio */
