#pragma once

namespace sm::concurrency {

struct Task {
    virtual ~Task() = default;
    virtual void operator()() = 0;
};

}
