#include "BasketBuilder.h"

#include <algorithm>

namespace Analytics {

    /**
     * Group line items by transaction: one basket per distinct transaction
     * ID, holding the distinct products of that transaction. Quantities are
     * irrelevant.
     *
     * Item IDs are assigned in ascending order of product name, so that they
     * only depend on which products are present, never on line order. Baskets
     * are ordered by ascending transaction ID.
     */
    BasketSet BasketBuilder::buildBaskets(const SalesData::TransactionLineList & lines) {
        BasketSet basketSet;

        QMap<TransactionID, QSet<ItemName> > transactions;
        QSet<ItemName> names;
        foreach (const SalesData::TransactionLine & line, lines) {
            transactions[line.transactionID].insert(line.productDetail);
            names.insert(line.productDetail);
        }

        // Map item names to item IDs.
        QStringList sortedNames = names.toList();
        sortedNames.sort();
        for (int i = 0; i < sortedNames.size(); i++) {
            basketSet.itemIDNameHash.insert((ItemID) i, sortedNames[i]);
            basketSet.itemNameIDHash.insert(sortedNames[i], (ItemID) i);
        }

        // Build the baskets.
        foreach (const QSet<ItemName> & products, transactions) {
            Basket basket;
            foreach (const ItemName & name, products)
                basket.append(basketSet.itemNameIDHash[name]);
            std::sort(basket.begin(), basket.end());
            basketSet.baskets.append(basket);
        }

        return basketSet;
    }
}
