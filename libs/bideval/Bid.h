// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __BIDEVAL_BID_H
#define __BIDEVAL_BID_H 1

#include <string>
#include <vector>
#include <set>
#include <optional>
#include <algorithm>
#include <boost/date_time/posix_time/posix_time.hpp>

namespace bideval
{
  using boost::posix_time::ptime;

  /**
   * @brief One line of a bid's declared compliance with the RFQ specifications
   */
  class SpecificationCompliance
  {
  public:
    SpecificationCompliance(const std::string& requirement, bool compliant)
      : mRequirement(requirement),
	mCompliant(compliant)
    {}

    SpecificationCompliance(const SpecificationCompliance&) = default;
    SpecificationCompliance& operator=(const SpecificationCompliance&) = default;

    const std::string& getRequirement() const
    {
      return mRequirement;
    }

    bool isCompliant() const
    {
      return mCompliant;
    }

  private:
    std::string mRequirement;
    bool mCompliant;
  };

  /**
   * @brief A supplier's priced, dated offer for an RFQ.
   *
   * Bids are immutable once constructed. Certifications are held as a set,
   * so a certification listed twice only counts once.
   */
  template <class Decimal>
  class Bid
  {
  public:
    Bid(const std::string& id,
	const std::string& supplierId,
	const std::string& supplierName,
	const Decimal& unitPrice,
	const std::string& currency,
	const ptime& deliveryDate,
	const std::vector<SpecificationCompliance>& specificationsCompliance,
	const std::set<std::string>& certifications,
	const std::optional<Decimal>& sustainabilityScore)
      : mId(id),
	mSupplierId(supplierId),
	mSupplierName(supplierName),
	mUnitPrice(unitPrice),
	mCurrency(currency),
	mDeliveryDate(deliveryDate),
	mSpecificationsCompliance(specificationsCompliance),
	mCertifications(certifications),
	mSustainabilityScore(sustainabilityScore)
    {}

    Bid(const std::string& id,
	const Decimal& unitPrice,
	const ptime& deliveryDate,
	const std::vector<SpecificationCompliance>& specificationsCompliance,
	const std::set<std::string>& certifications,
	const std::optional<Decimal>& sustainabilityScore = std::nullopt)
      : Bid(id, std::string(), std::string(), unitPrice, std::string("USD"),
	    deliveryDate, specificationsCompliance, certifications, sustainabilityScore)
    {}

    Bid(const Bid&) = default;
    Bid& operator=(const Bid&) = default;
    ~Bid() = default;

    const std::string& getId() const
    {
      return mId;
    }

    const std::string& getSupplierId() const
    {
      return mSupplierId;
    }

    const std::string& getSupplierName() const
    {
      return mSupplierName;
    }

    const Decimal& getUnitPrice() const
    {
      return mUnitPrice;
    }

    const std::string& getCurrency() const
    {
      return mCurrency;
    }

    const ptime& getDeliveryDate() const
    {
      return mDeliveryDate;
    }

    const std::vector<SpecificationCompliance>& getSpecificationsCompliance() const
    {
      return mSpecificationsCompliance;
    }

    const std::set<std::string>& getCertifications() const
    {
      return mCertifications;
    }

    const std::optional<Decimal>& getSustainabilityScore() const
    {
      return mSustainabilityScore;
    }

    size_t getNumRequirements() const
    {
      return mSpecificationsCompliance.size();
    }

    size_t getNumCompliant() const
    {
      return static_cast<size_t>(std::count_if(mSpecificationsCompliance.begin(),
					       mSpecificationsCompliance.end(),
					       [](const SpecificationCompliance& s) {
						 return s.isCompliant();
					       }));
    }

    size_t getNumCertifications() const
    {
      return mCertifications.size();
    }

  private:
    std::string mId;
    std::string mSupplierId;
    std::string mSupplierName;
    Decimal mUnitPrice;
    std::string mCurrency;
    ptime mDeliveryDate;
    std::vector<SpecificationCompliance> mSpecificationsCompliance;
    std::set<std::string> mCertifications;
    std::optional<Decimal> mSustainabilityScore;
  };
}

#endif
