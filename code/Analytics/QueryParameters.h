#ifndef QUERYPARAMETERS_H
#define QUERYPARAMETERS_H

namespace Analytics {

    // Tunables of a single analytics query.
    struct QueryParameters {
        QueryParameters()
            : topProducts(10),
              minSupport(0.02),
              maxItemsetLength(0),
              minLift(1.2),
              minConfidence(0.0),
              maxRules(10) {}

        int topProducts;
        double minSupport;      // Fraction of baskets, in (0,1].
        int maxItemsetLength;   // 0 means unlimited.
        double minLift;
        double minConfidence;   // 0 disables the confidence filter.
        int maxRules;           // 0 means unlimited.
    };

    inline bool operator==(const QueryParameters & a, const QueryParameters & b) {
        return a.topProducts == b.topProducts
               && a.minSupport == b.minSupport
               && a.maxItemsetLength == b.maxItemsetLength
               && a.minLift == b.minLift
               && a.minConfidence == b.minConfidence
               && a.maxRules == b.maxRules;
    }
}

#endif // QUERYPARAMETERS_H
