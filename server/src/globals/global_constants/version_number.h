#pragma once

namespace version_number {
    //stored with every error, errors can be marked as handled per version
    inline const unsigned int SERVER_CURRENT_VERSION_NUMBER = 1;
}
