#include "pipeline/ClassBalance.hpp"
#include <ostream>

ClassBalance countClasses(const std::vector<RentalRecord>& records) {
    ClassBalance balance;
    for (const auto& r : records) {
        if (r.rentalType) {
            ++balance.countTrue;
        } else {
            ++balance.countFalse;
        }
    }
    return balance;
}

bool reportClassBalance(const ClassBalance& balance, std::ostream& out, std::ostream& warn) {
    out << "Распределение классов:" << std::endl;
    out << "  RentalType = False: " << balance.countFalse << " записей" << std::endl;
    out << "  RentalType = True:  " << balance.countTrue << " записей" << std::endl;

    if (!balance.hasBothClasses()) {
        warn << "Внимание: В данных не хватает одного из классов!" << std::endl;
        return false;
    }
    return true;
}
