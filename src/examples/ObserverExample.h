#pragma once
#include "../core/Example.h"

namespace pattern_harness {
namespace examples {

class JobSeeker {
public:
    JobSeeker(std::string name, std::vector<std::string>& inbox) : name_(std::move(name)), inbox_(inbox) {}
    void on_job_posted(const std::string& title) { inbox_.push_back("Hi " + name_ + "! New job posted: " + title); }

private:
    std::string name_;
    std::vector<std::string>& inbox_;
};

// Subject. Observers are not owned and must unsubscribe before they go away.
class JobPostings {
public:
    void subscribe(JobSeeker* seeker);
    void unsubscribe(JobSeeker* seeker);
    void post(const std::string& title);
    std::size_t subscribers() const { return observers_.size(); }

private:
    std::vector<JobSeeker*> observers_;
};

class ObserverExample : public Example {
public:
    void setup() override {}
    std::vector<std::string> run() override;
    ExampleInfo describe() const override {
        return {"Observer", "Notify dependents automatically when an object's state changes"};
    }
};

}
}
