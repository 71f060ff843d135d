#ifndef MOCKSNAPSHOTSOURCE_HPP
#define MOCKSNAPSHOTSOURCE_HPP

#include "gmock/gmock.h"
#include "connection_status.hpp"

class mocksnapshotsource : public SnapshotSource {
    public:
        MOCK_METHOD(ActiveConnectionSnapshot, activeConnections, (), (override));
};

#endif
