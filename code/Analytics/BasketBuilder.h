#ifndef BASKETBUILDER_H
#define BASKETBUILDER_H

#include <QList>
#include <QMap>
#include <QSet>
#include <QStringList>

#include "Item.h"
#include "../SalesData/typedefs.h"


namespace Analytics {

    struct BasketSet {
        int size() const { return this->baskets.size(); }
        bool isEmpty() const { return this->baskets.isEmpty(); }

        QList<Basket> baskets;
        ItemIDNameHash itemIDNameHash;
        ItemNameIDHash itemNameIDHash;
    };

    class BasketBuilder {
    public:
        static BasketSet buildBaskets(const SalesData::TransactionLineList & lines);
    };
}

#endif // BASKETBUILDER_H
