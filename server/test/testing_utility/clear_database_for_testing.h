#pragma once

//drops every collection inside the testing databases, returns false if CM_TESTING is not defined
bool clearDatabaseAndGlobalsForTesting();
