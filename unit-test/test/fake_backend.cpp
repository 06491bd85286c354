#include "test/fake_backend.hpp"
#include "common/exceptions.hpp"

namespace arena::test {
using namespace std;

void fake_backend::update_submission(const string &submission_id, const submission_update &update) {
    if (failing) BOOST_THROW_EXCEPTION(network_error("fake backend is unavailable"));
    lock_guard<mutex> guard(mut);
    submission_updates.emplace_back(submission_id, update);
}

void fake_backend::update_match(const string &match_id, const match_update &update) {
    if (failing) BOOST_THROW_EXCEPTION(network_error("fake backend is unavailable"));
    lock_guard<mutex> guard(mut);
    match_updates.emplace_back(match_id, update);
}

vector<pair<string, submission_update>> fake_backend::submissions() const {
    lock_guard<mutex> guard(mut);
    return submission_updates;
}

vector<pair<string, match_update>> fake_backend::matches() const {
    lock_guard<mutex> guard(mut);
    return match_updates;
}

vector<string> fake_backend::submission_statuses(const string &submission_id) const {
    lock_guard<mutex> guard(mut);
    vector<string> result;
    for (auto &[id, update] : submission_updates)
        if (id == submission_id) result.push_back(update.status);
    return result;
}

vector<string> fake_backend::match_statuses(const string &match_id) const {
    lock_guard<mutex> guard(mut);
    vector<string> result;
    for (auto &[id, update] : match_updates)
        if (id == match_id) result.push_back(update.status);
    return result;
}

}  // namespace arena::test
