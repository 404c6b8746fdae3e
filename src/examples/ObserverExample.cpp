#include "ObserverExample.h"
#include <algorithm>

namespace pattern_harness {
namespace examples {

void JobPostings::subscribe(JobSeeker* seeker) {
    if(!seeker) return;
    if(std::find(observers_.begin(), observers_.end(), seeker) == observers_.end()) observers_.push_back(seeker);
}

void JobPostings::unsubscribe(JobSeeker* seeker) {
    observers_.erase(std::remove(observers_.begin(), observers_.end(), seeker), observers_.end());
}

void JobPostings::post(const std::string& title) {
    for(auto* o : observers_) o->on_job_posted(title);
}

std::vector<std::string> ObserverExample::run() {
    std::vector<std::string> out;
    JobSeeker john("John Doe", out);
    JobSeeker jane("Jane Doe", out);
    JobPostings postings;
    postings.subscribe(&john);
    postings.subscribe(&jane);
    postings.post("Software Engineer");
    postings.unsubscribe(&jane);
    postings.post("QA Engineer");
    return out;
}

}
}
